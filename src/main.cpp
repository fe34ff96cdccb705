#include <httpd/config.hpp>
#include <httpd/content_source.hpp>
#include <httpd/logging.hpp>
#include <httpd/server.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <iostream>
#include <signal.h>

namespace po = boost::program_options;

static std::atomic<httpd::server*> running{nullptr};

static void on_terminate(int) {
    if(httpd::server* s = running.load()) s->stop();
}

int main(int argc, char** argv) {
    httpd::server_config config;
    int timeout_seconds = 5;
    std::string duplicates = "join";

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help")
        ("host,H", po::value(&config.host)->default_value(config.host), "IPv4 address to bind")
        ("port,p", po::value(&config.port)->default_value(config.port), "port to bind")
        ("root,r", po::value(&config.root)->default_value(config.root), "document root")
        ("workers,w", po::value(&config.workers)->default_value(config.workers),
            "size of the worker pool, 0 for a thread per connection")
        ("timeout,t", po::value(&timeout_seconds)->default_value(timeout_seconds), "read/write timeout in seconds")
        ("duplicate-headers", po::value(&duplicates)->default_value(duplicates),
            "repeated request headers: join or last-wins")
        ("no-gzip", "never gzip response bodies")
        ("verbose,v", "log every connection and request detail");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& err) {
        std::cerr << err.what() << "\n" << desc << "\n";
        return 2;
    }
    if(vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }
    if(duplicates == "join") {
        config.limits.duplicates = httpd::duplicate_policy::join;
    } else if(duplicates == "last-wins") {
        config.limits.duplicates = httpd::duplicate_policy::last_wins;
    } else {
        std::cerr << "--duplicate-headers must be 'join' or 'last-wins'\n";
        return 2;
    }
    if(timeout_seconds <= 0 || config.workers < 0) {
        std::cerr << "--timeout must be positive and --workers not negative\n";
        return 2;
    }
    config.read_timeout = config.write_timeout = std::chrono::seconds{timeout_seconds};
    config.gzip = vm.count("no-gzip") == 0;

    httpd::init_logging(vm.count("verbose") ? boost::log::trivial::trace : boost::log::trivial::info);

    // Ignore "broken pipe" signals (ie unexpected socket closures)
    // They are handled correctly in networking code.
    signal(SIGPIPE, SIG_IGN);

    try {
        httpd::directory_source content{config.root};
        httpd::server s{config, content};
        running.store(&s);
        signal(SIGINT, on_terminate);
        signal(SIGTERM, on_terminate);
        s.serve_forever();
        running.store(nullptr);
        BOOST_LOG_TRIVIAL(info) << "Keyboard interrupt. Stopping server";
    } catch (const std::exception& ex) {
        BOOST_LOG_TRIVIAL(fatal) << "Server failed: " << ex.what();
        return 1;
    }
}
