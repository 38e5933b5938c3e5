#pragma once

int cmd_timeline(int argc, char** argv);
