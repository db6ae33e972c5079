#pragma once

// rts parse <path> [--from N] [--to N] [--per-line] [--strict] [--json <out>] [--config <file>]
int cmd_parse(int argc, char** argv);
