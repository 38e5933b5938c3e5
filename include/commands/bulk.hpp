#pragma once

int cmd_timelines(int argc, char** argv);
int cmd_followers(int argc, char** argv);
int cmd_friends(int argc, char** argv);
