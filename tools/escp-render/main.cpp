//=============================================================================
// escp-render - render a YAML page layout to an ESC/P byte stream
//
// The stream goes to a file (-o), stdout (-o -) or a printer device (-d).
// Log output always goes to stderr so stdout stays clean for the stream.
//=============================================================================

#include <escp/config.h>
#include <escp/document.h>
#include <escp/layout-loader.h>
#include <escp/printer.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <args.hxx>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace escp;

static int writeStream(const std::string& path, const std::vector<uint8_t>& bytes) {
    if (path == "-") {
        if (std::fwrite(bytes.data(), 1, bytes.size(), stdout) != bytes.size() || std::fflush(stdout) != 0) {
            yerror("Failed to write {} bytes to stdout", bytes.size());
            return 1;
        }
        return 0;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        yerror("Cannot open output file: {}", path);
        return 1;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out.flush()) {
        yerror("Failed to write output file: {}", path);
        return 1;
    }
    yinfo("Wrote {} bytes to {}", bytes.size(), path);
    return 0;
}

static void printStatus(const std::string& device, const PrinterStatus& status) {
    std::cerr << device << ": "
              << (status.online ? "online" : "offline")
              << (status.paperOut ? ", paper out" : "")
              << (status.error ? ", error" : "")
              << (status.isReady() ? " (ready)" : " (not ready)") << "\n";
}

int main(int argc, char** argv) {
    args::ArgumentParser parser("escp-render - render a YAML page layout to ESC/P");
    parser.Prog("escp-render");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> outputFlag(parser, "FILE",
        "Write the byte stream to FILE (- for stdout)", {'o', "output"});
    args::ValueFlag<std::string> deviceFlag(parser, "PATH",
        "Send to a printer device (default from config)", {'d', "device"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file", {'c', "config"});
    args::Flag statusFlag(parser, "status", "Query printer status first", {"status"});
    args::Flag previewFlag(parser, "preview", "Print a plain-text preview of every page", {"preview"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> layoutFile(parser, "layout", "YAML layout file");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    spdlog::set_default_logger(spdlog::stderr_color_mt("escp-render"));
    spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::info);

    YAML::Node overrides(YAML::NodeType::Map);
    if (deviceFlag) overrides["printer"]["device"] = args::get(deviceFlag);
    if (outputFlag) overrides["output"]["path"] = args::get(outputFlag);
    if (statusFlag) overrides["printer"]["query-status"] = true;

    auto configResult = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configResult) {
        yerror("{}", error_msg(configResult));
        return 1;
    }
    auto config = *configResult;

    if (!verboseFlag) {
        spdlog::set_level(spdlog::level::from_str(config->logLevel()));
    }
    spdlog::cfg::load_env_levels();

    std::string device = config->printerDevice();
    std::string outputPath = config->outputPath();

    Printer::Ptr printer;
    if (config->queryStatusFirst()) {
        auto printerResult = Printer::open(device);
        if (!printerResult) {
            yerror("{}", error_msg(printerResult));
            return 1;
        }
        printer = *printerResult;

        auto status = printer->queryStatus(config->statusTimeout());
        if (!status) {
            yerror("Status query failed: {}", error_msg(status));
            return 1;
        }
        printStatus(device, *status);
        if (!layoutFile) {
            return status->isReady() ? 0 : 1;
        }
        if (!status->isReady()) {
            yerror("Printer {} is not ready", device);
            return 1;
        }
    }

    if (!layoutFile) {
        std::cerr << "escp-render: no layout file given\n";
        std::cerr << parser;
        return 1;
    }

    auto docResult = loadDocumentFile(args::get(layoutFile));
    if (!docResult) {
        yerror("{}", error_msg(docResult));
        return 1;
    }
    const Document& doc = *docResult;

    if (previewFlag) {
        // Keep stdout free when the byte stream goes there
        std::ostream& previewOut = (outputPath == "-") ? std::cerr : std::cout;
        for (size_t i = 0; i < doc.pageCount(); ++i) {
            previewOut << "--- page " << (i + 1) << " ---\n" << doc.pages()[i].text() << "\n";
        }
    }

    if (!outputPath.empty()) {
        if (int rc = writeStream(outputPath, doc.render()); rc != 0) {
            return rc;
        }
    }

    // Print when a device was asked for, or when there is no other destination
    bool toPrinter = deviceFlag || printer || (outputPath.empty() && !previewFlag);
    if (!toPrinter) {
        return 0;
    }

    if (!printer) {
        auto printerResult = Printer::open(device);
        if (!printerResult) {
            yerror("{}", error_msg(printerResult));
            return 1;
        }
        printer = *printerResult;
    }
    if (auto res = printer->print(doc); !res) {
        yerror("{}", error_msg(res));
        return 1;
    }
    return 0;
}
