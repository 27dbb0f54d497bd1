#pragma once

// cmd_validate: run a rule set over a JSON or SQLite dataset and print the report
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
