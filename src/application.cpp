#include "application.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include <glib-unix.h>

#include "net/http.hpp"

application::application() = default;

application::~application() {
    if (m_loop) {
        g_main_loop_unref(m_loop);
    }
}

bool application::parse_arguments(int& argc, char**& argv, std::string& err) {
    gint workers = G_MININT;
    gint chunks_per_worker = 0;
    gint interval_ms = 0;
    gint window_seconds = 0;
    gint connect_timeout = -1;
    gboolean json = FALSE;
    g_autofree gchar* config_path = nullptr;

    GOptionEntry entries[] = {
        {"workers", 'w', 0, G_OPTION_ARG_INT, &workers,
         "Concurrent fetchers (default: hardware threads)", "N"},
        {"chunks-per-worker", 0, 0, G_OPTION_ARG_INT, &chunks_per_worker,
         "Chunks planned per worker (default: 1)", "N"},
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &config_path, "JSON configuration file",
         "FILE"},
        {"interval", 'i', 0, G_OPTION_ARG_INT, &interval_ms,
         "Reporting interval in milliseconds (default: 1000)", "MS"},
        {"window", 'W', 0, G_OPTION_ARG_INT, &window_seconds,
         "Sliding window in seconds (default: 10)", "SEC"},
        {"timeout", 't', 0, G_OPTION_ARG_INT, &connect_timeout,
         "Connect timeout in seconds (default: 10)", "SEC"},
        {"json", 'j', 0, G_OPTION_ARG_NONE, &json, "Print readings as JSON lines", nullptr},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr},
    };

    g_autoptr(GOptionContext) context = g_option_context_new("URL");
    g_option_context_set_summary(
        context, "Measure download bandwidth to URL with concurrent range requests.");
    g_option_context_add_main_entries(context, entries, nullptr);

    g_autoptr(GError) error = nullptr;
    if (!g_option_context_parse(context, &argc, &argv, &error)) {
        err = error->message;
        return false;
    }
    if (argc != 2) {
        g_autofree gchar* help = g_option_context_get_help(context, TRUE, nullptr);
        err = "expected exactly one URL\n" + std::string(help);
        return false;
    }
    m_url = argv[1];

    // Defaults, then the config file, then command-line overrides
    if (config_path && !load_config_file(config_path, m_config, err)) {
        return false;
    }
    if (workers != G_MININT)
        m_config.workers = workers > 0 ? workers : 1;
    if (chunks_per_worker != 0)
        m_config.chunks_per_worker = chunks_per_worker;
    if (interval_ms != 0)
        m_config.tick_interval_ms = interval_ms;
    if (window_seconds != 0)
        m_config.window_seconds = window_seconds;
    if (connect_timeout >= 0)
        m_config.connect_timeout_seconds = connect_timeout;
    if (json)
        m_config.json_output = true;

    return validate_config(m_config, err);
}

int application::run(int argc, char** argv) {
    std::string err;
    if (!parse_arguments(argc, argv, err)) {
        std::cerr << "[application] " << err << std::endl;
        return 1;
    }

    // Readings own stdout; in JSON mode diagnostics move to stderr
    std::streambuf* stdout_buf = std::cout.rdbuf();
    m_output = std::make_unique<std::ostream>(stdout_buf);
    if (m_config.json_output) {
        std::cout.rdbuf(std::cerr.rdbuf());
    }
    m_reporter = std::make_unique<reporter>(*m_output, m_config.json_output);
    m_test = std::make_unique<bandwidth_test>(http_client::factory(make_client_options(m_config)));

    m_loop = g_main_loop_new(nullptr, FALSE);
    guint sigint_source = g_unix_signal_add(SIGINT, on_signal, nullptr);
    guint sigterm_source = g_unix_signal_add(SIGTERM, on_signal, nullptr);

    const auto opts = make_test_options(m_config);
    std::thread runner([this, opts]() {
        bandwidth_test::transfer_report report;
        try {
            report = m_test->run(m_url, opts, [](const speed_reading& reading) {
                g_idle_add(on_reading, new speed_reading(reading));
            });
        } catch (const std::exception& e) {
            std::cerr << "[application] Bandwidth test failed: " << e.what() << std::endl;
            report.outcome = transfer_outcome::aborted;
            report.probe_status = {error_kind::internal, e.what()};
        }
        // The main loop must always be released
        g_idle_add(on_finished, new bandwidth_test::transfer_report(std::move(report)));
    });

    g_main_loop_run(m_loop);
    runner.join();

    g_source_remove(sigint_source);
    g_source_remove(sigterm_source);
    std::cout.rdbuf(stdout_buf);

    return exit_code();
}

int application::exit_code() const {
    switch (m_report.outcome) {
    case transfer_outcome::all_chunks_completed:
        return 0;
    case transfer_outcome::aborted:
        return 1;
    case transfer_outcome::completed_with_failures:
        return m_interrupted ? 130 : 2;
    case transfer_outcome::cancelled:
        return 130;
    }
    return 1;
}

gboolean application::on_signal(gpointer user_data) {
    application& self = application::instance();
    if (!self.m_interrupted) {
        std::cout << "[application] Interrupt received, cancelling transfer" << std::endl;
    }
    self.m_interrupted = true;
    if (self.m_test) {
        self.m_test->cancel();
    }
    return G_SOURCE_CONTINUE;
}

gboolean application::on_reading(gpointer user_data) {
    application& self = application::instance();
    std::unique_ptr<speed_reading> reading(static_cast<speed_reading*>(user_data));
    self.m_reporter->print_reading(*reading);
    return G_SOURCE_REMOVE;
}

gboolean application::on_finished(gpointer user_data) {
    application& self = application::instance();
    std::unique_ptr<bandwidth_test::transfer_report> report(
        static_cast<bandwidth_test::transfer_report*>(user_data));
    self.m_report = std::move(*report);
    self.m_reporter->print_summary(self.m_report);
    g_main_loop_quit(self.m_loop);
    return G_SOURCE_REMOVE;
}
