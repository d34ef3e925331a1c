#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <filesystem>
#include <memory>
#include <libruparan/ruparan_core.h>

namespace fs = std::filesystem;

// Forward declarations
void printHelp();
void printResiduals(const ConversionResult& result, int limit);

// "baat aur kya hai" as typed in the DV-TT parliamentary font
static const char* kSampleText = "¤ÉÉiÉ +ÉÉè® BÉDªÉÉ cÉä ";

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool testMode = false;
    bool quiet = false;
    bool strict = false;
    std::string dataDir;
    std::string dbPath;
    int residualLimit = 10; // Default limit

    // --- Argument Parsing ---
    auto it = args.begin();
    while (it != args.end()) {
        if (*it == "-test") {
            testMode = true;
            it = args.erase(it);
        } else if (*it == "--quiet") {
            quiet = true;
            it = args.erase(it);
        } else if (*it == "--strict") {
            strict = true;
            it = args.erase(it);
        } else if (*it == "--limit") {
            it = args.erase(it);
            if (it != args.end()) {
                try {
                    residualLimit = std::stoi(*it);
                    it = args.erase(it);
                } catch (const std::exception& e) {
                    std::cerr << "Error: Invalid number for --limit." << std::endl;
                    return 1;
                }
            } else {
                std::cerr << "Error: --limit requires a number." << std::endl;
                return 1;
            }
        } else if (*it == "--data-dir" || *it == "--db") {
            std::string option = *it;
            it = args.erase(it);
            if (it == args.end()) {
                std::cerr << "Error: " << option << " requires a path." << std::endl;
                return 1;
            }
            (option == "--db" ? dbPath : dataDir) = *it;
            it = args.erase(it);
        } else {
            ++it;
        }
    }

    if (testMode) {
        #ifdef RUPARAN_SRC_DIR
            const char* srcDir = RUPARAN_SRC_DIR;
            dataDir = fs::path(srcDir) / "core" / "data";
            std::cout << "[Test Mode]: Using local data files from: " << dataDir << std::endl;
        #else
            std::cerr << "Error: Test mode requires RUPARAN_SRC_DIR to be set at compile time." << std::endl;
            return 1;
        #endif
    }


    if (args.empty()) {
        printHelp();
        return 0;
    }

    std::string command = args[0];

    //  Command Handling
    if (command == "help") {
        printHelp();
        return 0;
    }
    if (command == "--version" || command == "version") {
        std::cout << "libruparan version " << RUPARAN_VERSION << std::endl;
        return 0;
    }

    std::unique_ptr<LegacyFontConverter> converter;
    try {
        converter = std::make_unique<LegacyFontConverter>(dataDir);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    bool residualsFound = false;

    if (command == "convert") {
        if (args.size() < 2) {
            std::cerr << "Usage: ruparan-cli convert <legacy_text>" << std::endl;
            return 1;
        }
        ConversionResult result = converter->convert(args[1]);
        std::cout << result.text << std::endl;
        if (!quiet) printResiduals(result, residualLimit);
        residualsFound = !result.clean();
    }
    else if (command == "convert-file") {
        if (args.size() < 2) {
            std::cerr << "Usage: ruparan-cli convert-file <path_to_file>" << std::endl;
            return 1;
        }
        std::ifstream file(args[1]);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open file: " << args[1] << std::endl;
            return 1;
        }
        std::string line;
        long lineNo = 0;
        while (std::getline(file, line)) {
            ++lineNo;
            ConversionResult result = converter->convert(line);
            std::cout << result.text << '\n';
            if (!result.clean()) {
                residualsFound = true;
                if (!quiet) {
                    std::cerr << args[1] << ":" << lineNo << ":";
                    printResiduals(result, residualLimit);
                }
            }
        }
        std::cout.flush();
    }
    else if (command == "demo") {
        const std::string rule(70, '=');
        std::cout << rule << "\nINDIC FONT LEGACY CONVERTER\n" << rule << "\n";
        std::cout << "\nInput (Kruti Dev):\n" << kSampleText << "\n" << std::endl;
        ConversionResult result = converter->convert(kSampleText);
        if (!quiet) printResiduals(result, residualLimit);
        std::cout << "\n" << rule << "\nCONVERTED (Unicode Hindi):\n" << rule << "\n";
        std::cout << result.text << "\n\n" << rule << std::endl;
    }
    else if (command == "tables") {
        const ReorderRule& reorder = converter->reorderRule();
        std::cout << "# data: " << converter->dataDir() << "\n";
        std::cout << "reorder\t" << codepointToUtf8(reorder.marker) << "\t" << formatCodepoint(reorder.marker)
                  << "\t-> <next> " << codepointToUtf8(reorder.vowelSign) << " (" << formatCodepoint(reorder.vowelSign) << ")\n";
        for (const MappingTable* table : {&converter->multiUnitTable(), &converter->singleUnitTable()}) {
            const char* label = table->kind() == MappingTable::MultiUnit ? "multi" : "single";
            for (const MappingRule& rule : table->rules()) {
                std::cout << label << "\t" << rule.legacy << "\t" << rule.unicode << std::endl;
            }
        }
    }
#ifdef HAVE_SQLITE3
    else { // Ledger related commands
        try {
            ResidualLedger ledger(dbPath);

            if (command == "record-file") {
                if (args.size() < 2) {
                    std::cerr << "Usage: ruparan-cli record-file <path_to_file>" << std::endl; return 1;
                }
                long lines = ledger.recordFromFile(args[1], *converter);
                std::cout << "Recorded residuals from " << lines << " line(s) of " << args[1] << std::endl;
                residualsFound = lines > 0;
            }
            else if (command == "list-residuals") {
                auto entries = ledger.getAll(residualLimit > 0 ? residualLimit : -1);
                if (entries.empty()) {
                    std::cout << "Residual ledger is empty." << std::endl;
                } else {
                    for (const auto& entry : entries) {
                        std::cout << "'" << codepointToUtf8(entry.codepoint) << "' (" << formatCodepoint(entry.codepoint)
                                  << ") freq: " << entry.frequency << "  first seen: " << entry.firstSource << std::endl;
                    }
                }
            }
            else if (command == "ledger-info") {
                auto info = ledger.getDatabaseInfo();
                if (info.empty()) {
                    std::cerr << "Could not retrieve database information." << std::endl;
                } else {
                    for (const auto& pair : info) {
                        std::cout << pair.first << ": " << pair.second << std::endl;
                    }
                }
            }
            else if (command == "reset-ledger") {
                ledger.reset();
                std::cout << "Residual ledger cleared." << std::endl;
            } else {
                std::cerr << "Unknown command: " << command << std::endl;
                printHelp();
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }
#else
    else {
        std::cerr << "Unknown command: " << command << std::endl;
        std::cerr << "(Ledger commands need a build with the 'sqlite3' development libraries.)" << std::endl;
        return 1;
    }
#endif

    return (strict && residualsFound) ? 2 : 0;
}

void printResiduals(const ConversionResult& result, int limit) {
    if (result.clean()) return;
    std::cerr << "Warning: " << result.residuals.size() << " unconverted character type(s) in output" << std::endl;
    int shown = 0;
    for (const Residual& residual : result.residuals) {
        if (limit > 0 && shown++ >= limit) {
            std::cerr << "  ..." << std::endl;
            break;
        }
        std::cerr << "  '" << codepointToUtf8(residual.codepoint) << "' (" << formatCodepoint(residual.codepoint)
                  << ") x" << residual.count << std::endl;
    }
}

void printHelp() {
    std::cout << "Ruparan Command-Line Tool\n";
    std::cout << "Version: " << getRuparanVersion() << "\n\n";
    std::cout << "Usage: ruparan-cli [-test] [--data-dir <dir>] <command> [arguments] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  convert <text>            Converts Kruti Dev / DV-TT text to Unicode Devanagari.\n";
    std::cout << "  convert-file <path>       Converts a file line by line to standard output.\n";
    std::cout << "  demo                      Converts a built-in sample sentence.\n";
    std::cout << "  tables                    Lists the mapping rules in the order they are applied.\n";
    std::cout << "  version, --version        Display the library version.\n";
    std::cout << "  help                      Show this help message.\n";
#ifdef HAVE_SQLITE3
    std::cout << "\nLedger Commands (require SQLite):\n";
    std::cout << "  record-file <path>        Converts a file and records unconverted characters.\n";
    std::cout << "  list-residuals            Lists recorded characters, most frequent first.\n";
    std::cout << "  ledger-info               Displays information and location of the ledger.\n";
    std::cout << "  reset-ledger              Deletes all recorded characters.\n";
#endif
    std::cout << "\nOptions:\n";
    std::cout << "  -test                       Use local data files (for development).\n";
    std::cout << "  --data-dir <dir>            Load mapping.toml from <dir>.\n";
    std::cout << "  --limit <number>            Number of unconverted characters to report (0 for all).\n";
    std::cout << "  --quiet                     Do not report unconverted characters.\n";
    std::cout << "  --strict                    Exit with status 2 if anything was left unconverted.\n";
#ifdef HAVE_SQLITE3
    std::cout << "  --db <path>                 Use this ledger database file.\n";
#endif
}
