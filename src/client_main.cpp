#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "archive/archive.hpp"
#include "client/client.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/status.hpp"
#include "spec/test_spec.hpp"
using namespace std;

static void print_case(const arbiter::case_result &result) {
    cout << fmt::format("{:<16} {:<24} {:>8.3f}s {:>10}KB", result.case_id, arbiter::get_display_message(result.result), result.time, result.memory) << endl;
    if (!result.detail.empty() && result.result != arbiter::verdict::ACCEPTED)
        cout << "    " << result.detail << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("arbiter options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("server", po::value<string>(), "set the server address, ws://host:port or wss://host:port. You can either pass it from environ SERVER")
        ("dir", po::value<string>()->required(), "set the submission directory to pack and submit")
        ("spec", po::value<string>(), "set the test specification file, sent along with the submission")
        ("spec-path", po::value<string>(), "set the path of the test specification inside the submission directory")
        ("timeout", po::value<unsigned>()->default_value(0), "give up waiting for the result after the given seconds, 0 means no limit")
        ("echo", "print every message received from the server")
        ("help", "display this help text");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "arbiter: submit a directory to arbiterd and print the verdict of each case" << endl
                 << "Usage: " << argv[0] << " --server ws://host:port --dir <dir> (--spec <file> | --spec-path <path>)" << endl;
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

    string server;
    if (vm.count("server")) {
        server = vm.at("server").as<string>();
    } else if (getenv("SERVER")) {
        server = getenv("SERVER");
    } else {
        cerr << "--server is required" << endl;
        return 2;
    }

    if (vm.count("spec") == vm.count("spec-path")) {
        cerr << "exactly one of --spec and --spec-path is required" << endl;
        return 2;
    }

    arbiter::client::submit_options options;
    options.url = server;
    options.timeout = chrono::seconds(vm.at("timeout").as<unsigned>());

    try {
        filesystem::path dir = vm.at("dir").as<string>();
        options.archive = arbiter::pack_directory(dir);

        // 在本地先解析一遍，配置有误时不必连接服务端
        if (vm.count("spec")) {
            filesystem::path spec_file = vm.at("spec").as<string>();
            string text;
            try {
                text = arbiter::read_file_content(spec_file);
            } catch (std::system_error &e) {
                throw arbiter::spec_error(arbiter::spec_error_reason::SYNTAX, "unable to read " + spec_file.string() + ": " + e.what());
            }
            arbiter::test_spec spec = arbiter::load_test_spec(text);
            arbiter::resolve_test_files(spec, dir);
            options.spec_text = text;
        } else {
            string relative = arbiter::assert_safe_path(vm.at("spec-path").as<string>());
            arbiter::test_spec spec = arbiter::load_test_spec_file(dir / relative);
            arbiter::resolve_test_files(spec, dir);
            options.spec_path = relative;
        }
    } catch (arbiter::arbiter_exception &e) {
        cerr << "[" << arbiter::to_string(e.kind()) << "] " << e.what() << endl;
        return 2;
    } catch (std::exception &e) {
        cerr << e.what() << endl;
        return 2;
    }

    LOG(INFO) << "Submitting " << options.archive.digest << " (" << options.archive.bytes.size() << " bytes) to " << server;

    arbiter::client::submit_callbacks callbacks;
    callbacks.on_accepted = [](const string &job) {
        cout << "job " << job << " accepted" << endl;
    };
    callbacks.on_case_result = print_case;
    callbacks.on_error = [](const arbiter::server::error_message &error) {
        cerr << "[" << arbiter::to_string(error.kind) << "] " << error.message << endl;
    };
    if (vm.count("echo"))
        callbacks.on_message = [](const string &text) {
            cout << text << endl;
        };

    arbiter::client::submit_outcome outcome;
    try {
        outcome = arbiter::client::submit_job(options, callbacks);
    } catch (std::exception &e) {
        cerr << e.what() << endl;
        return 2;
    }

    if (outcome.timed_out) {
        cerr << "timed out waiting for the result" << endl;
    } else if (!outcome.connection_error.empty()) {
        cerr << "connection lost: " << outcome.connection_error << endl;
    }

    if (outcome.summary) {
        size_t passed = 0;
        for (auto &result : outcome.summary->cases)
            if (result.result == arbiter::verdict::ACCEPTED) ++passed;
        cout << fmt::format("{} {}: {} ({}/{} cases accepted)",
                            outcome.summary->job,
                            arbiter::to_string(outcome.summary->phase),
                            arbiter::get_display_message(outcome.summary->result),
                            passed, outcome.summary->cases.size())
             << endl;
    }

    return arbiter::client::exit_code_for(outcome);
}
