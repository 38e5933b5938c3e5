#pragma once

int cmd_users(int argc, char** argv);
