#include "check/local_checker.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

check_report check_submission(const string &spec, const fs::path &dir, bool spec_in_archive) {
    if (!fs::is_directory(dir))
        throw archive_error("submission directory " + dir.string() + " does not exist");

    check_report report;
    auto files = read_directory(dir);
    report.archive = pack_archive(files);
    report.file_count = files.size();

    // 按服务端的限制解包一次，超出限制的提交在这里就能发现
    auto unpacked = unpack_archive(report.archive.bytes, default_archive_limits());
    if (unpacked != files)
        throw archive_error("archive does not reproduce the submission directory");

    if (spec_in_archive) {
        string relative;
        try {
            relative = assert_safe_path(spec);
        } catch (invalid_argument &e) {
            throw spec_error(spec_error_reason::INVALID_VALUE, e.what());
        }
        if (!fs::is_regular_file(dir / relative))
            throw spec_error(spec_error_reason::INVALID_VALUE, "test specification " + relative + " not found in " + dir.string());
        report.spec = load_test_spec_file(dir / relative);
    } else {
        report.spec = load_test_spec_file(spec);
    }

    resolve_test_files(report.spec, dir);
    DLOG(INFO) << "Checked " << report.file_count << " files, " << report.spec.cases.size() << " cases";
    return report;
}

}  // namespace arbiter
