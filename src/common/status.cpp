#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<run_state, const char *> run_state_string = boost::assign::map_list_of
    (run_state::PENDING, "pending")
    (run_state::RUNNING, "running")
    (run_state::COMPLETED, "completed")
    (run_state::TIMED_OUT, "timed-out")
    (run_state::OUTPUT_TRUNCATED, "output-truncated")
    (run_state::CRASHED, "crashed")
    (run_state::CANCELLED, "cancelled")
    (run_state::SYSTEM_ERROR, "system-error");

static const unordered_map<outcome, const char *> outcome_string = boost::assign::map_list_of
    (outcome::COMPLETED, "completed")
    (outcome::TIMED_OUT, "timed-out")
    (outcome::OUTPUT_TRUNCATED, "output-truncated")
    (outcome::CRASHED, "crashed")
    (outcome::BUILD_FAILED, "build-failed")
    (outcome::TOOLCHAIN_MISSING, "toolchain-missing")
    (outcome::SYSTEM_ERROR, "system-error");

static const unordered_map<lab_status, const char *> lab_status_string = boost::assign::map_list_of
    (lab_status::NOT_STARTED, "not_started")
    (lab_status::IN_PROGRESS, "in_progress")
    (lab_status::SUBMITTED, "submitted")
    (lab_status::PASSED, "passed")
    (lab_status::FAILED, "failed");
// clang-format on

const char *get_display_message(run_state state) {
    return run_state_string.at(state);
}

const char *get_display_message(outcome result) {
    return outcome_string.at(result);
}

const char *get_display_message(lab_status stat) {
    return lab_status_string.at(stat);
}

outcome to_outcome(run_state state) {
    switch (state) {
        case run_state::COMPLETED:
            return outcome::COMPLETED;
        case run_state::TIMED_OUT:
            return outcome::TIMED_OUT;
        case run_state::OUTPUT_TRUNCATED:
            return outcome::OUTPUT_TRUNCATED;
        case run_state::CRASHED:
            return outcome::CRASHED;
        default:
            return outcome::SYSTEM_ERROR;
    }
}

outcome parse_outcome(const string &tag) {
    for (auto &[key, value] : outcome_string)
        if (tag == value) return key;
    throw invalid_argument("unknown outcome " + tag);
}

lab_status parse_lab_status(const string &tag) {
    for (auto &[key, value] : lab_status_string)
        if (tag == value) return key;
    throw invalid_argument("unknown lab status " + tag);
}

}  // namespace grader
