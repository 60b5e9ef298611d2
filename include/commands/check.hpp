#pragma once

// Integrity check of a stored collection; exit code 2 when references dangle.
int cmd_check(int argc, char** argv);

// Folds several stored collections into one, in argument order.
int cmd_merge(int argc, char** argv);
