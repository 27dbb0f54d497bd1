#pragma once

// cmd_show_report: print a stored report by --report-id, or list a --dataset's reports
int cmd_show_report(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
