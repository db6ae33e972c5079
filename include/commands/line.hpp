#pragma once

// rts line "<text>" [--strict]
int cmd_line(int argc, char** argv);
