#pragma once

// Subcommands of agency_cli. Each returns the process exit code.

int cmd_serve(int argc, char** argv);
int cmd_process(int argc, char** argv);
int cmd_run(int argc, char** argv);
int cmd_resume(int argc, char** argv);
int cmd_snapshots(int argc, char** argv);
