#include "cleanocr.hpp"
#include "errors.hpp"
#include "generative_grammar_checker.hpp"
#include "languagetool_client.hpp"
#include "paddle_ocr_engine.hpp"
#include "tesseract_engine.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
const std::vector<std::string> SUPPORTED_FORMATS = {".jpg", ".jpeg", ".png", ".bmp", ".gif", ".tif", ".tiff"};
const std::string RULE(70, '=');

struct AppConfig {
    std::string image;
    std::string folder;
    bool check_errors = true;
    bool save_output = false;
    std::string output_dir = "output";

    std::string engine = "tesseract";
    std::string language_hint = "rus+eng";
    std::string tessdata = "/usr/share/tesseract-ocr/5/tessdata";
    std::string models_dir = "../../models";
    int timeout_ms = 30000;
    unsigned jobs = 0;

    std::string dictionary;
    std::string languagetool_url;
    std::string grammar_model;
    std::string grammar_language = "ru-RU";

    bool span_replace = false;
    bool whole_word_context = false;
    bool quiet = false;
};

bool isImageFile(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return std::find(SUPPORTED_FORMATS.begin(), SUPPORTED_FORMATS.end(), ext) != SUPPORTED_FORMATS.end();
}

std::unique_ptr<TextExtractor> makeExtractor(const AppConfig& config, unsigned workers) {
    if (config.engine == "paddle") {
        return std::make_unique<PaddleOcrEngine>(config.models_dir);
    }
    if (config.engine == "tesseract") {
        return std::make_unique<TesseractEngine>(config.tessdata, config.language_hint, workers, config.timeout_ms);
    }
    throw std::invalid_argument("Unknown OCR engine: " + config.engine);
}

std::unique_ptr<GrammarChecker> makeGrammarChecker(const AppConfig& config) {
    try {
        if (!config.languagetool_url.empty()) {
            return std::make_unique<LanguageToolClient>(config.languagetool_url, config.grammar_language, config.timeout_ms);
        }
        if (!config.grammar_model.empty()) {
            return std::make_unique<GenerativeGrammarChecker>(config.grammar_model, "Russian", config.timeout_ms);
        }
    } catch (const CapabilityUnavailable& e) {
        std::cerr << "Warning: grammar checking disabled: " << e.what() << std::endl;
    }
    return nullptr;
}

std::unique_ptr<SpellChecker> makeSpellChecker(const AppConfig& config) {
    if (config.dictionary.empty()) return nullptr;
    try {
        return std::make_unique<FrequencySpellChecker>(config.dictionary);
    } catch (const CapabilityUnavailable& e) {
        std::cerr << "Warning: spell checking disabled: " << e.what() << std::endl;
    }
    return nullptr;
}

void printResult(const ProcessResult& result, std::ostream& out) {
    out << "\n" << RULE << "\n";
    out << "  RECOGNIZED TEXT:\n";
    out << RULE << "\n";
    out << (result.full_text.empty() ? "(empty)" : result.full_text) << "\n\n";
    out << "  STATISTICS:\n";
    out << "  Characters: " << result.statistics.characters << "\n";
    out << "  Words: " << result.statistics.words << "\n";

    if (result.checked) {
        out << "\n  ISSUES FOUND: " << result.error_count << "\n";
        for (size_t i = 0; i < result.errors.size(); ++i) {
            const auto& issue = result.errors[i];
            out << "  " << (i + 1) << ". [" << KindName(issue.kind) << "] '" << issue.matched_span
                << "' -> '" << issue.suggestion << "'";
            if (issue.candidates && issue.candidates->size() > 1) {
                out << " (";
                for (size_t k = 0; k < issue.candidates->size(); ++k) {
                    out << (k ? ", " : "") << (*issue.candidates)[k];
                }
                out << ")";
            }
            if (!issue.auto_apply) out << " (not applied)";
            out << "\n";
        }
        if (result.corrected_text != result.full_text) {
            out << "\n  CORRECTED TEXT:\n" << result.corrected_text << "\n";
        }
    }
    out << RULE << "\n" << std::endl;
}

void processFiles(CleanOCR& app, const std::vector<std::filesystem::path>& files, const AppConfig& config,
                  std::ostream& report) {
    ProcessOptions options;
    options.check_errors = config.check_errors;
    options.save_output = config.save_output;

    size_t failed = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];
        std::cout << "\n[" << (i + 1) << "/" << files.size() << "] Processing: " << file.filename().string() << std::endl;

        auto start = std::chrono::steady_clock::now();
        ProcessResult result = app.Process(file.string(), options);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

        if (!result.success) {
            std::cerr << "Error: " << result.error << std::endl;
            ++failed;
            continue;
        }

        printResult(result, report);
        std::cout << "Processed in " << elapsed.count() << " ms" << std::endl;

        if (options.save_output) {
            try {
                report << "Saved: " << SaveResult(result.full_text, file.string(), config.output_dir) << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "Failed to save result: " << e.what() << std::endl;
            }
        }
    }

    if (files.size() > 1) {
        report << "\nCompleted " << (files.size() - failed) << "/" << files.size() << " files" << std::endl;
    }
}

void showUsage(const char* program_name) {
    std::cout << "CleanOCR - text extraction with OCR error correction\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " (-i IMAGE | -d FOLDER) [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -i, --image FILE        Image to process\n";
    std::cout << "  -d, --folder DIR        Process every supported image in DIR\n";
    std::cout << "  --no-check              Skip error checking\n";
    std::cout << "  -o, --output            Save recognized text\n";
    std::cout << "  --output-dir DIR        Where saved text goes (default: output)\n";
    std::cout << "  -e, --engine NAME       tesseract (default) or paddle\n";
    std::cout << "  -l, --lang LANGS        OCR language hint (default: rus+eng)\n";
    std::cout << "  --tessdata DIR          Tesseract data directory\n";
    std::cout << "  -m, --models DIR        PaddleOCR models directory (default: ../../models)\n";
    std::cout << "  --dict FILE             Word-frequency dictionary for spell checking\n";
    std::cout << "  --languagetool URL      LanguageTool server for grammar checking\n";
    std::cout << "  --grammar-model DIR     Local generative model for grammar checking\n";
    std::cout << "  -j, --jobs N            Variants recognized in parallel (default: CPU cores)\n";
    std::cout << "  --timeout MS            Per-call engine timeout (default: 30000)\n";
    std::cout << "  --span-replace          Apply corrections only at the spans they were found\n";
    std::cout << "  --whole-word-context    Match context phrases on word boundaries only\n";
    std::cout << "  -q, --quiet             Only print results and errors\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -i scan.png\n";
    std::cout << "  " << program_name << " -d scans/ --no-check\n";
    std::cout << "  " << program_name << " -i page.jpg --dict ru_freq.txt --languagetool http://localhost:8081 -o\n";
}
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        showUsage(argv[0]);
        return 1;
    }

    AppConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            showUsage(argv[0]);
            return 0;
        } else if ((arg == "-i" || arg == "--image") && has_value) {
            config.image = argv[++i];
        } else if ((arg == "-d" || arg == "--folder") && has_value) {
            config.folder = argv[++i];
        } else if (arg == "--no-check") {
            config.check_errors = false;
        } else if (arg == "-o" || arg == "--output") {
            config.save_output = true;
        } else if (arg == "--output-dir" && has_value) {
            config.output_dir = argv[++i];
        } else if ((arg == "-e" || arg == "--engine") && has_value) {
            config.engine = argv[++i];
        } else if ((arg == "-l" || arg == "--lang") && has_value) {
            config.language_hint = argv[++i];
        } else if (arg == "--tessdata" && has_value) {
            config.tessdata = argv[++i];
        } else if ((arg == "-m" || arg == "--models") && has_value) {
            config.models_dir = argv[++i];
        } else if (arg == "--dict" && has_value) {
            config.dictionary = argv[++i];
        } else if (arg == "--languagetool" && has_value) {
            config.languagetool_url = argv[++i];
        } else if (arg == "--grammar-model" && has_value) {
            config.grammar_model = argv[++i];
        } else if ((arg == "-j" || arg == "--jobs") && has_value) {
            config.jobs = static_cast<unsigned>(std::max(1, std::atoi(argv[++i])));
        } else if (arg == "--timeout" && has_value) {
            config.timeout_ms = std::max(0, std::atoi(argv[++i]));
        } else if (arg == "--span-replace") {
            config.span_replace = true;
        } else if (arg == "--whole-word-context") {
            config.whole_word_context = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    if (config.image.empty() && config.folder.empty()) {
        std::cerr << "Error: specify an image (-i) or a folder (-d)." << std::endl;
        showUsage(argv[0]);
        return 1;
    }

    // Results always reach the console; quiet mode swallows progress output.
    std::ostream report(std::cout.rdbuf());
    std::ostringstream discarded;
    std::streambuf* old_cout = config.quiet ? std::cout.rdbuf(discarded.rdbuf()) : nullptr;

    int exit_code = 0;
    try {
        unsigned workers = config.jobs;
        if (workers == 0) {
            workers = std::max(1u, std::thread::hardware_concurrency());
        }

        std::vector<std::filesystem::path> files;
        if (!config.image.empty()) {
            files.push_back(config.image);
        } else {
            if (!std::filesystem::is_directory(config.folder)) {
                throw NotFoundError("Folder not found: " + config.folder);
            }
            for (const auto& entry : std::filesystem::directory_iterator(config.folder)) {
                if (entry.is_regular_file() && isImageFile(entry.path())) {
                    files.push_back(entry.path());
                }
            }
            std::sort(files.begin(), files.end());
        }

        CorrectionConfig correction;
        correction.substitution = config.span_replace ? SubstitutionMode::SpanBased : SubstitutionMode::Compatible;
        correction.context_whole_words = config.whole_word_context;

        std::unique_ptr<CorrectionPipeline> pipeline;
        if (config.check_errors) {
            pipeline = std::make_unique<CorrectionPipeline>(correction, makeGrammarChecker(config), makeSpellChecker(config));
            CapabilityAvailability available = pipeline->Availability();
            std::cout << "Grammar checking: " << (available.grammar ? "on" : "off")
                      << ", spell checking: " << (available.spelling ? "on" : "off") << std::endl;
        }

        CleanOCR app(makeExtractor(config, workers), std::move(pipeline), config.language_hint, workers);
        processFiles(app, files, config, report);
        if (app.Pipeline()) app.Pipeline()->Shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exit_code = 1;
    }

    if (old_cout) std::cout.rdbuf(old_cout);
    return exit_code;
}
