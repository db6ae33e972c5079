#pragma once

namespace ingredient {

struct ParseConfig {
    bool strict = false;    // fail on malformed groups instead of skipping
    bool per_line = false;  // parse every input line on its own
    int from_line = 0;      // first line kept, 0-based
    int to_line = -1;       // one past the last line kept; -1 = end of file
};

}
