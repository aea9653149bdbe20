#include "report/ReportTool.hpp"
#include "util/Logger.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

#ifndef REPRISE_VERSION
#define REPRISE_VERSION "0.0.0"
#endif

int main(int argc, char** argv) {
    CLI::App app{"List stored resume points and whether their files still exist", "reprise-report"};
    app.set_version_flag("-V,--version", std::string("reprise-report ") + REPRISE_VERSION);

    std::string path = ".";
    app.add_option("path", path, "Path to check for stored files.")
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    try {
        int rc = reprise::report::ReportTool::run(path, std::cout);
        if (rc != 0) {
            std::cerr << "reprise-report: cannot read directory " << path << "\n";
        }
        return rc;
    } catch (const std::exception& e) {
        reprise::util::Logger::error(std::string("reprise-report: ") + e.what());
        return 1;
    }
}
