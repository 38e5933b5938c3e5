#pragma once
#include "api/Client.hpp"
#include "log/Logger.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace bulk {

struct WorkItem {
    std::string identity; // output file basename key, unique within a run
    api::UserRef value;
};

struct WorkArgs {
    api::UserRef user;
    std::optional<int64_t> since_id; // set only when resuming from a checkpoint
};

// One remote fetch for one item, written to out. May throw api::ApiError.
using WorkFn = std::function<void(std::ostream& out, const WorkArgs& args)>;

enum class ItemStatus { success, skipped, remote_failure, malformed_checkpoint };

struct ItemOutcome {
    std::string identity;
    ItemStatus status = ItemStatus::success;
    std::string detail;
};

struct RunResult {
    size_t processed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<ItemOutcome> outcomes; // input order
};

// Runs fn; api::ApiError becomes remote_failure, anything else propagates.
ItemOutcome invoke_work(const WorkFn& fn, std::ostream& out, const WorkArgs& args);

// "%s" -> identity, "%%" -> "%"; the template must contain at least one "%s"
std::string format_filename(const std::string& tmpl, const std::string& identity);

class BulkRunner {
    logging::Logger& log_;

public:
    explicit BulkRunner(logging::Logger& log) : log_(log) {}

    // Sequential, one output file per item:
    //   missing           -> fresh write, no since_id
    //   exists, !resume   -> skipped with a warning
    //   exists, resume    -> since_id = latest_id(file), append
    // Remote failures and malformed checkpoints are item-local; filesystem errors propagate.
    RunResult run(const std::filesystem::path& output_dir,
                  const std::string& filename_template,
                  const WorkFn& fn,
                  const std::vector<WorkItem>& items,
                  bool resume);

private:
    ItemOutcome process_item(const std::filesystem::path& output_dir,
                             const std::string& filename_template,
                             const WorkFn& fn,
                             const WorkItem& item,
                             bool resume);
};

} // namespace bulk
