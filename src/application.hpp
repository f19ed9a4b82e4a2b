#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <glib.h>

#include "bandwidth_test.hpp"
#include "config.hpp"
#include "reporter.hpp"

class application {
public:
    static application& instance() {
        static application app;
        return app;
    }

    int run(int argc, char** argv);

    // Remove copy/move constructors
    application(const application&) = delete;
    application& operator=(const application&) = delete;
    application(application&&) = delete;
    application& operator=(application&&) = delete;

private:
    application();
    ~application();

    config m_config;
    std::string m_url;
    GMainLoop* m_loop = nullptr;
    std::unique_ptr<std::ostream> m_output;
    std::unique_ptr<reporter> m_reporter;
    std::unique_ptr<bandwidth_test> m_test;
    bandwidth_test::transfer_report m_report;
    bool m_interrupted = false;

    bool parse_arguments(int& argc, char**& argv, std::string& err);
    int exit_code() const;

    // Main-loop handlers; readings and the final report are marshalled here
    // from the transfer threads with g_idle_add.
    static gboolean on_signal(gpointer user_data);
    static gboolean on_reading(gpointer user_data);
    static gboolean on_finished(gpointer user_data);
};
