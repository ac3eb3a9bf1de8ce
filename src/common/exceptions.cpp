#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

artifact_incomplete::artifact_incomplete(const string &message)
    : grader_exception(message) {}

lab_not_found::lab_not_found(const string &message)
    : grader_exception(message) {}

lab_corrupt::lab_corrupt(const string &message)
    : grader_exception(message) {}

build_failed::build_failed(const string &message, const string &diagnostics)
    : grader_exception(message), diagnostics(diagnostics) {}

toolchain_missing::toolchain_missing(const string &language, const string &binary)
    : grader_exception("toolchain for " + language + " is missing: " + binary + " not found"),
      language(language), binary(binary) {}

generation_unavailable::generation_unavailable(const string &message)
    : grader_exception(message) {}

grade_record_write_conflict::grade_record_write_conflict(const string &message)
    : grader_exception(message) {}

submission_aborted::submission_aborted(const string &message)
    : grader_exception(message) {}

}  // namespace grader
