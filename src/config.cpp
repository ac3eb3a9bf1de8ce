#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path DATA_DIR;
filesystem::path RUN_DIR;
string TOOLCHAIN_PATH;
set<string> ENV_ALLOW_LIST = {"PATH", "HOME", "LANG", "LC_ALL", "TERM", "TZ", "TMPDIR"};

double DEFAULT_PASS_THRESHOLD = 0.6;
double DEFAULT_TIME_LIMIT = 10;              // 10s
double MAX_TIME_LIMIT = 3600;                // 1h
double MAX_TEST_WEIGHT = 1e12;
size_t DEFAULT_OUTPUT_LIMIT = 64 * 1024;     // 64K
size_t FILE_SIZE_LIMIT = 64 << 20;           // 64M
double KILL_DELAY = 0.1;                     // 0.1s
double COMPILE_TIME_LIMIT = 30;              // 30s
size_t COMPILE_OUTPUT_LIMIT = 256 * 1024;    // 256K
double GENERATOR_TIME_LIMIT = 120;           // 2min
unsigned WORKER_COUNT = 0;
double GRADE_LOCK_TIMEOUT = 5;               // 5s
size_t FEEDBACK_LINE_LIMIT = 120;
size_t DIAGNOSTICS_LIMIT = 2000;
bool DEBUG = false;

}  // namespace grader
