#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <iostream>
#include "check/local_checker.hpp"
#include "common/exceptions.hpp"
using namespace std;

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("arbiter-check options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("spec", po::value<string>()->required(), "set the test specification file to check")
        ("dir", po::value<string>()->required(), "set the submission directory to check")
        ("spec-in-archive", "treat --spec as a path inside the submission directory")
        ("dump", "print the parsed test specification as JSON")
        ("help", "display this help text");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "arbiter-check: check a test specification and a submission directory before submitting" << endl
                 << "Usage: " << argv[0] << " --spec <file> --dir <dir> [--spec-in-archive]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 2;
    }

    try {
        auto report = arbiter::check_submission(vm.at("spec").as<string>(), vm.at("dir").as<string>(), vm.count("spec-in-archive") > 0);
        if (vm.count("dump"))
            cout << arbiter::spec_to_json(report.spec).dump(2) << endl;
        cout << "OK: " << report.spec.cases.size() << " cases, "
             << report.file_count << " files, "
             << report.archive.bytes.size() << " bytes, digest " << report.archive.digest << endl;
        return EXIT_SUCCESS;
    } catch (arbiter::arbiter_exception &e) {
        cerr << "[" << arbiter::to_string(e.kind()) << "] " << e.what() << endl;
        return 1;
    } catch (std::exception &e) {
        cerr << e.what() << endl;
        return 1;
    }
}
