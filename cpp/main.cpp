// Copyright (C) 2024 Simon Quigley <tsimonq2@ubuntu.com>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "build_executor.h"
#include "callback_notifier.h"
#include "config.h"
#include "job_processor.h"
#include "kube_client.h"
#include "registry_client.h"
#include "sql_queue.h"
#include "status_server.h"
#include "utilities.h"

#include <atomic>
#include <csignal>
#include <cstring>
#include <ctime>
#include <format>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

#include <QCoreApplication>
#include <QMetaObject>

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>   Specify path to config file (environment variables override it)\n";
    std::cout << "  -v, --verbose         Enable verbose logging\n";
    std::cout << "  -h, --help            Show this help message and exit\n";
}

int main(int argc, char* argv[]) {
    // Every thread started below inherits this mask, so SIGINT and SIGTERM
    // only ever reach the sigtimedwait loop
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    QCoreApplication app(argc, argv);

    std::optional<fs::path> configFilePath;
    bool verboseFlag = false;
    bool showHelp = false;

    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},
        {"verbose", no_argument,       0, 'v'},
        {"help",    no_argument,       0, 'h'},
        {0,         0,                 0,  0 }
    };

    while (true) {
        int option_index = 0;
        int opt = getopt_long(argc, argv, "c:vh", long_options, &option_index);
        if (opt == -1)
            break;

        switch (opt) {
            case 'c':
                configFilePath = fs::path(optarg);
                break;
            case 'v':
                verboseFlag = true;
                break;
            case 'h':
            default:
                showHelp = true;
                break;
        }
    }

    if (showHelp) {
        printHelp(argv[0]);
        return 0;
    }

    WorkerConfig config;
    try {
        config = load_worker_config(configFilePath);
    } catch (const std::exception& e) {
        log_error(std::format("Invalid configuration: {}", e.what()));
        return 1;
    }
    verbose = verboseFlag || config.verbose;

    std::shared_ptr<JobProcessor> processor;
    try {
        SqlQueueOptions queue_options;
        queue_options.driver = config.queue_driver;
        queue_options.database = config.queue_database;
        queue_options.host = config.queue_host;
        queue_options.port = config.queue_port;
        queue_options.user = config.queue_user;
        queue_options.password = config.queue_password;
        auto queue = std::make_shared<SqlBuildQueue>(queue_options);

        KubeConnection connection = config.kubeconfig.empty() ? in_cluster_connection()
                                                              : load_kubeconfig(config.kubeconfig);
        log_info(std::format("Using cluster API at {}", connection.server));

        auto http = std::make_shared<HttpClient>();
        auto cluster = std::make_shared<KubeClient>(connection, http);
        auto registry = std::make_shared<RegistryClient>(config.registry_user, config.registry_password, http);
        auto executor = std::make_shared<BuildExecutor>(ExecutorOptions::from_config(config), cluster, registry);
        auto notifier = std::make_shared<CallbackNotifier>(config.callback_api_key, config.callback_timeout, http);

        processor = JobProcessor::create(ProcessorOptions::from_config(config), queue, executor, notifier);
    } catch (const std::exception& e) {
        log_error(std::format("Failed to start worker: {}", e.what()));
        return 1;
    }

    std::unique_ptr<StatusServer> status_server;
    if (config.status_port > 0) {
        status_server = std::make_unique<StatusServer>(processor);
        if (!status_server->start_server(static_cast<quint16>(config.status_port))) {
            return 1;
        }
    }

    std::atomic<int> exit_code{0};
    std::jthread processor_thread([&processor, &exit_code, &app](std::stop_token stop) {
        exit_code = processor->run(stop);
        QMetaObject::invokeMethod(&app, &QCoreApplication::quit, Qt::QueuedConnection);
    });

    // First signal drains, a second one cancels the builds still running
    std::jthread signal_thread([&processor, &processor_thread, shutdown_signals](std::stop_token stop) {
        bool draining = false;
        while (!stop.stop_requested()) {
            const timespec poll{0, 500'000'000};
            const int sig = sigtimedwait(&shutdown_signals, nullptr, &poll);
            if (sig < 0) continue;
            if (!draining) {
                log_info(std::format("Received {}, draining", strsignal(sig)));
                processor->request_shutdown();
                draining = true;
            } else {
                log_warning(std::format("Received {} again, cancelling in-flight builds", strsignal(sig)));
                processor_thread.request_stop();
            }
        }
    });

    app.exec();
    signal_thread.request_stop();
    signal_thread.join();
    processor_thread.join();
    return exit_code;
}
