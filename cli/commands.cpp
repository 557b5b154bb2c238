#include "commands.hpp"

#include "stepfrag/config.hpp"
#include "stepfrag/converter.hpp"
#include "stepfrag/file_profiler.hpp"

#include <filesystem>
#include <string>

namespace stepfrag::cli {

namespace {

void PrintUsage(std::ostream& err) {
    err << "Usage:\n"
        << "  stepfrag profile <file.ifc>\n"
        << "  stepfrag convert <file.ifc> [output.frag]\n"
        << "\n"
        << "If output is omitted, it is written next to the input with the configured\n"
        << "extension (STEPFRAG_OUTPUT_EXT, default .frag). Settings are read from .env\n"
        << "and the environment: STEPFRAG_CODEC, STEPFRAG_LEVEL, STEPFRAG_CHUNK_BYTES,\n"
        << "STEPFRAG_PROGRESS_INTERVAL_MS, STEPFRAG_INFER_COMPLETION.\n";
}

int RunProfile(const std::filesystem::path& path, std::ostream& out, std::ostream& err) {
    try {
        auto profile = Profile(path);
        out << FormatProfileReport(profile);
        return 0;
    } catch (const std::exception& e) {
        err << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

int RunConvert(const Config& cfg, const std::filesystem::path& input, const std::filesystem::path& output,
               std::ostream& out, std::ostream& err) {
    Converter converter(cfg, {}, {}, out, err);
    auto result = converter.Convert(input, output);
    out.flush();
    err.flush();
    out << FormatResultLine(result) << std::endl;
    return result.success ? 0 : 1;
}

} // namespace

int Run(int argc, char** argv, std::ostream& out, std::ostream& err) {
    if (argc < 3) {
        PrintUsage(err);
        return 1;
    }

    std::string cmd = argv[1];
    std::filesystem::path input = std::filesystem::absolute(argv[2]);

    if (cmd == "profile") {
        return RunProfile(input, out, err);
    }

    if (cmd == "convert") {
        Config cfg = LoadConfig();
        std::filesystem::path output = argc >= 4 ? std::filesystem::absolute(argv[3])
                                                 : DeriveOutputPath(input, cfg.output_extension);
        return RunConvert(cfg, input, output, out, err);
    }

    err << "Unknown command: " << cmd << "\n";
    PrintUsage(err);
    return 1;
}

} // namespace stepfrag::cli
