#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <variant>

#include <getopt.h>

#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "FileStream.hpp"
#include "ServiceInfoCodec.hpp"
#include "UploadOwnerModule.hpp"

using ArgList = std::map<std::string, std::string>;

namespace {
    enum ExitCode {
        kCommitted = 0,
        kUsage = 1,
        kModuleError = 2,
        kIncomplete = 3
    };

    volatile std::sig_atomic_t stop_requested = 0;

    void HandleSignal(int)
    {
        stop_requested = 1;
    }

    // One ProduceInfo() round; whatever the module queued goes to out
    std::tuple<bool, OwnerModule::Progress> Produce(UploadOwnerModule& module, std::ostream& out)
    {
        ProtoMessageWriter writer(UploadOwnerModule::kModuleName);
        const auto [ok, progress, err] = module.ProduceInfo(writer);

        for (const auto& message : writer.GetMessages()) {
            if (!google::protobuf::util::SerializeDelimitedToOstream(message, &out)) {
                spdlog::error("failed to write message {}", message.name());
                return { false, progress };
            }
            spdlog::debug("sent {}:{}", message.module(), message.name());
        }
        out.flush();

        if (!ok) {
            spdlog::error("{} error: {}", ToString(err.kind), err.message);
            return { false, progress };
        }

        return { true, progress };
    }
}

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
    ArgList arglist;

    const struct option options[] = {
            { "loglevel", required_argument, nullptr, 'l' },
            { "rename", required_argument, nullptr, 'r' },
            { "staging-dir", required_argument, nullptr, 's' },
            { "input", required_argument, nullptr, 'i' },
            { nullptr, 0, nullptr, 0 }
    };

    try {
        int optidx;
        for (int opt; (opt = getopt_long(argc, argv, "l:r:s:i:", options, &optidx)) != -1; ) {
            switch (opt) {
            case 'l':
                arglist["loglevel"] = optarg;
                break;
            case 'r':
                arglist["rename"] = optarg;
                break;
            case 's':
                arglist["staging-dir"] = optarg;
                break;
            case 'i':
                arglist["input"] = optarg;
                break;
            case ':':
                return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
            case '?':
            default:
                return { false, fmt::format("invalid argument: {}", static_cast<char>(optopt)) };
            }
        }
    }
    catch (std::exception& e) {
        return { false, fmt::format("invalid argument: {}", e.what()) };
    }

    if (argc - optind < 2)
        return { false, fmt::format("usage: {} [--loglevel <level>] [--rename <name>] [--staging-dir <directory>] [--input <file>] <destination-dir> <remote-name>", *argv) };

    argv += optind;

    arglist["destination-dir"] = *argv++;
    arglist["remote-name"] = *argv++;

    if (arglist.find("loglevel") == arglist.end())
        arglist["loglevel"] = "info";

    return { true, arglist };
}

void ShowArgument(const ArgList& arglist)
{
    for (const auto &[name, value]: arglist)
        spdlog::debug("{}: {}", name, value);
}

int main(int argc, char* argv[])
{
    // stdout carries the protocol, diagnostics go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("fdo-upload-owner"));

    const auto &[success, result] = ParseArgument(argc, argv);
    if (!success) {
        spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
        return kUsage;
    }

    const ArgList& arglist = std::get<ArgList>(result);
    spdlog::set_level(spdlog::level::from_str(arglist.at("loglevel")));
    ShowArgument(arglist);

    UploadRequest request;
    request.dir = arglist.at("destination-dir");
    request.name = arglist.at("remote-name");
    if (auto it = arglist.find("rename"); it != arglist.end())
        request.rename = it->second;
    if (auto it = arglist.find("staging-dir"); it != arglist.end()) {
        const std::filesystem::path staging_dir = it->second;
        request.create_temp = [staging_dir]() {
            return FileStream::CreateTemp(staging_dir, "fdo.upload_");
        };
    }

    std::ifstream file;
    std::istream* in = &std::cin;
    if (auto it = arglist.find("input"); it != arglist.end()) {
        file.open(it->second, std::ios::binary);
        if (!file.is_open()) {
            spdlog::error("failed to open input {}", it->second);
            return kUsage;
        }
        in = &file;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    UploadOwnerModule module(std::move(request));

    bool ok = false;
    OwnerModule::Progress progress;

    std::tie(ok, progress) = Produce(module, std::cout);
    if (!ok)
        return kModuleError;

    google::protobuf::io::IstreamInputStream input(in);

    while (!progress.done) {
        // Checked between messages only, a commit in progress always finishes
        if (stop_requested) {
            spdlog::warn("interrupted, upload of {} not committed", arglist.at("remote-name"));
            return kIncomplete;
        }

        ServiceInfoMessage message;
        bool clean_eof = false;
        if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(&message, &input, &clean_eof)) {
            if (clean_eof) {
                spdlog::warn("input ended in phase '{}', {} byte(s) received",
                             ToString(module.GetPhase()), module.GetBytesWritten());
                return kIncomplete;
            }
            spdlog::error("malformed message in input");
            return kModuleError;
        }

        if (message.module() != UploadOwnerModule::kModuleName) {
            spdlog::debug("skipping message {}:{}", message.module(), message.name());
            continue;
        }

        ProtoMessageReader body(message.body());
        if (auto err = module.HandleInfo(message.name(), body)) {
            spdlog::error("{} error: {}", ToString(err->kind), err->message);
            return kModuleError;
        }

        std::tie(ok, progress) = Produce(module, std::cout);
        if (!ok)
            return kModuleError;
    }

    spdlog::info("upload committed to {}", module.GetResult()->path.string());

    return kCommitted;
}
