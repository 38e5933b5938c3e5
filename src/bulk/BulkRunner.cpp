#include "bulk/BulkRunner.hpp"
#include "bulk/Checkpoint.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace bulk {

std::string format_filename(const std::string& tmpl, const std::string& identity) {
    std::string out;
    out.reserve(tmpl.size() + identity.size());
    bool has_placeholder = false;

    for (size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] != '%') {
            out.push_back(tmpl[i]);
            continue;
        }
        if (i + 1 >= tmpl.size()) throw std::invalid_argument("filename template ends with '%': " + tmpl);

        const char c = tmpl[++i];
        if (c == 's') {
            out += identity;
            has_placeholder = true;
        } else if (c == '%') {
            out.push_back('%');
        } else {
            throw std::invalid_argument(std::string("unsupported conversion '%") + c + "' in filename template: " + tmpl);
        }
    }

    if (!has_placeholder) throw std::invalid_argument("filename template has no %s: " + tmpl);
    return out;
}

ItemOutcome invoke_work(const WorkFn& fn, std::ostream& out, const WorkArgs& args) {
    ItemOutcome o;
    try {
        fn(out, args);
        o.status = ItemStatus::success;
    } catch (const api::ApiError& e) {
        o.status = ItemStatus::remote_failure;
        o.detail = e.what();
    }
    return o;
}

ItemOutcome BulkRunner::process_item(const fs::path& output_dir,
                                     const std::string& filename_template,
                                     const WorkFn& fn,
                                     const WorkItem& item,
                                     bool resume) {
    const fs::path output_path = output_dir / format_filename(filename_template, item.identity);

    WorkArgs args;
    args.user = item.value;

    const bool existed = fs::exists(output_path);
    if (existed) {
        if (!resume) {
            log_.warning("skipping existing file: " + output_path.string());
            return ItemOutcome{item.identity, ItemStatus::skipped, ""};
        }
        try {
            args.since_id = latest_id(output_path);
        } catch (const MalformedRecordError& e) {
            log_.error("cannot resume " + output_path.string(), e);
            return ItemOutcome{item.identity, ItemStatus::malformed_checkpoint, e.what()};
        }
    }

    log_.info("processing: " + item.value.value);
    if (args.since_id) log_.info("latest id processed: " + std::to_string(*args.since_id));

    ItemOutcome outcome;
    {
        std::ofstream out(output_path, resume ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!out) throw std::runtime_error("failed to open output file: " + output_path.string());

        outcome = invoke_work(fn, out, args);

        out.flush();
        if (!out) throw std::runtime_error("failed to write output file: " + output_path.string());
    }
    outcome.identity = item.identity;

    if (outcome.status == ItemStatus::remote_failure) {
        log_.error("exception while using the REST API for " + item.identity + ": " + outcome.detail);
        // a failed fresh write leaves no file behind, so a plain rerun retries the item
        if (!existed) fs::remove(output_path);
    }
    return outcome;
}

RunResult BulkRunner::run(const fs::path& output_dir,
                          const std::string& filename_template,
                          const WorkFn& fn,
                          const std::vector<WorkItem>& items,
                          bool resume) {
    // reject a bad template before touching the filesystem
    format_filename(filename_template, "");

    if (!fs::exists(output_dir)) {
        fs::create_directories(output_dir);
        log_.info("created output directory: " + output_dir.string());
    }

    RunResult res;
    res.outcomes.reserve(items.size());

    for (const auto& item : items) {
        ItemOutcome o = process_item(output_dir, filename_template, fn, item, resume);
        switch (o.status) {
            case ItemStatus::success: ++res.processed; break;
            case ItemStatus::skipped: ++res.skipped; break;
            case ItemStatus::remote_failure:
            case ItemStatus::malformed_checkpoint: ++res.failed; break;
        }
        res.outcomes.push_back(std::move(o));
    }

    return res;
}

} // namespace bulk
