#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "server/request_handler.hpp"
#include "store/memory_store.hpp"
#include "store/mysql_store.hpp"
#include "worker.hpp"
using namespace std;

ctf::concurrent_queue<ctf::request_task> request_queue;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    ctf::stop_workers();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("ctf-ledger options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the JSON configuration file. You can either pass it from environ CTF_CONFIG")
        ("seed", po::value<string>(), "import challenges, users and teams from the given JSON file before processing requests, overrides the seed in configuration. You can either pass it from environ CTF_SEED")
        ("input", po::value<string>(), "read requests from the given file instead of stdin, one JSON object per line")
        ("workers", po::value<size_t>(), "set the number of threads processing requests concurrently, default to 1. You can either pass it from environ CTF_WORKERS")
        ("decay-factor", po::value<int>(), "override scoring.decay_factor of configuration")
        ("cache-ttl", po::value<int>(), "override cache.ttl_ms of configuration, 0 to disable the leaderboard cache")
        ("debug", "turn on the debug mode to attach diagnostic information to error responses. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "ctf-ledger: Verify flag submissions, score them, and serve leaderboards" << endl
             << "Requests are read from stdin line by line, responses are written to stdout" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "ctf-ledger 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        ctf::DEBUG = true;
    } else if (getenv("DEBUG")) {
        ctf::DEBUG = true;
    }

    ctf::configuration config;
    string config_path;
    if (vm.count("config")) {
        config_path = vm.at("config").as<string>();
    } else if (getenv("CTF_CONFIG")) {
        config_path = getenv("CTF_CONFIG");
    }
    if (!config_path.empty()) {
        CHECK(filesystem::is_regular_file(config_path))
            << "Configuration file " << config_path << " does not exist";
        try {
            config = ctf::load_configuration(config_path);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
        }
    }

    if (vm.count("seed")) {
        config.seed = vm.at("seed").as<string>();
    } else if (getenv("CTF_SEED")) {
        config.seed = getenv("CTF_SEED");
    }

    if (vm.count("decay-factor")) {
        config.scoring.decay_factor = vm["decay-factor"].as<int>();
        CHECK(config.scoring.decay_factor >= 0) << "Decay factor should not be negative";
    }

    if (vm.count("cache-ttl")) {
        config.cache.ttl_ms = vm["cache-ttl"].as<int>();
        config.cache.enabled = config.cache.ttl_ms > 0;
    }

    size_t workers = 1;
    if (vm.count("workers")) {
        workers = vm["workers"].as<size_t>();
    } else if (getenv("CTF_WORKERS")) {
        workers = boost::lexical_cast<size_t>(getenv("CTF_WORKERS"));
    }
    CHECK(workers > 0) << "At least one worker is required";

    unique_ptr<ctf::store::ledger_store> store;
    try {
        if (config.storage == "mysql") {
            store = make_unique<ctf::store::mysql_store>(config.database);
        } else {
            store = make_unique<ctf::store::memory_store>();
        }
    } catch (ctf::ctf_exception& e) {
        LOG(FATAL) << "Unable to initialize " << config.storage << " storage: " << e;
    }
    LOG(INFO) << "Using " << config.storage << " storage";

    ctf::engine engine(move(store), config);

    if (!config.seed.empty()) {
        CHECK(filesystem::is_regular_file(config.seed))
            << "Seed file " << config.seed << " does not exist";
        try {
            ifstream fin(config.seed);
            engine.seed(nlohmann::json::parse(fin));
        } catch (std::exception& e) {
            LOG(FATAL) << "Seed file " << config.seed << " is malformed: " << boost::diagnostic_information(e);
        }
    }

    ifstream input_file;
    if (vm.count("input")) {
        string input_path = vm["input"].as<string>();
        input_file.open(input_path);
        CHECK(input_file.is_open()) << "Unable to open input file " << input_path;
    }
    istream& input = input_file.is_open() ? static_cast<istream&>(input_file) : cin;

    ctf::server::request_handler handler(engine);
    mutex output_mutex;
    auto emit = [&output_mutex](const string& response) {
        scoped_lock lock(output_mutex);
        cout << response << endl;
    };

    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(ctf::start_worker(i, handler, request_queue, emit));

    string line;
    size_t line_no = 0;
    while (getline(input, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;
        request_queue.push({line_no, line});
    }
    request_queue.close();

    for (auto& th : worker_threads)
        th.join();

    LOG(INFO) << "Processed " << line_no << " lines";
    return 0;
}
