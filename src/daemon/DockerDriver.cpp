/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "DockerDriver.hpp"

#include <cerrno>
#include <cstring>
#include <functional>
#include <fcntl.h>
#include <unistd.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/regex.hpp>
#include <rapidjson/pointer.h>

#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/PathRAII.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace daemon {

// The child's stderr is merged into the pipe that carries its stdout
static const boost::optional<std::function<void()>> mergeStderrIntoStdout{
    std::function<void()>{[]() { dup2(STDOUT_FILENO, STDERR_FILENO); }}
};

static std::string removeTrailingNewline(const std::string& line) {
    auto result = line;
    boost::algorithm::trim_right_if(result, boost::is_any_of("\r\n"));
    return result;
}

DockerDriver::DockerDriver(std::shared_ptr<const common::Config> config)
    : config{std::move(config)},
      dockerPath{this->config->dockerPath}
{}

DaemonInfo DockerDriver::info() const {
    auto args = libshipyard::CLIArguments{dockerPath, "info", "--format", "{{json .}}"};
    auto output = boost::algorithm::join(runAndCollectOutput(args), "\n");

    auto json = rapidjson::Document{};
    try {
        json = libshipyard::json::parse(output);
    }
    catch(libshipyard::Error& e) {
        SHIPYARD_RETHROW_ERROR(e, "Failed to parse the output of docker info");
    }

    auto info = DaemonInfo{};
    if(json.IsObject() && json.HasMember("OperatingSystem") && json["OperatingSystem"].IsString()) {
        info.operatingSystem = json["OperatingSystem"].GetString();
    }
    if(json.IsObject() && json.HasMember("Architecture") && json["Architecture"].IsString()) {
        info.architecture = json["Architecture"].GetString();
    }
    printLog(boost::format("Daemon runs on '%s' (%s)") % info.operatingSystem % info.architecture,
             libshipyard::LogLevel::DEBUG);
    return info;
}

void DockerDriver::build(const boost::filesystem::path& contextArchive,
                         const rapidjson::Value& options,
                         const OutputHandler& outputHandler) const {
    // the classic builder streams the plain "Step N/M" output
    auto args = libshipyard::CLIArguments{"env", "DOCKER_BUILDKIT=0", dockerPath, "build"}
              + makeBuildArguments(options)
              + libshipyard::CLIArguments{"-"};

    int contextFd = open(contextArchive.c_str(), O_RDONLY | O_CLOEXEC);
    if(contextFd == -1) {
        auto message = boost::format("Failed to open build context %s: %s") % contextArchive % strerror(errno);
        SHIPYARD_THROW_ERROR(message.str());
    }

    auto preExec = std::function<void()>{[contextFd]() {
        dup2(contextFd, STDIN_FILENO);
        dup2(STDOUT_FILENO, STDERR_FILENO);
    }};

    auto lastLine = std::string{};
    auto lineHandler = [&outputHandler, &lastLine](const std::string& line) {
        auto trimmed = removeTrailingNewline(line);
        if(!trimmed.empty()) {
            lastLine = trimmed;
        }
        if(outputHandler) {
            outputHandler(line);
        }
    };

    int status;
    try {
        status = libshipyard::process::forkExecWait(args, preExec, {}, lineHandler);
    }
    catch(libshipyard::Error& e) {
        close(contextFd);
        SHIPYARD_RETHROW_ERROR(e, "Failed to run docker build");
    }
    close(contextFd);

    if(status != 0) {
        auto message = boost::format("docker build exited with status %d: %s") % status % lastLine;
        SHIPYARD_THROW_ERROR(message.str());
    }
}

void DockerDriver::pull(const std::string& image, const ProgressHandler& progressHandler) const {
    printLog(boost::format("Pulling image '%s'") % image, libshipyard::LogLevel::INFO);
    auto outputLines = std::vector<std::string>{};
    try {
        runAndForwardProgress(libshipyard::CLIArguments{dockerPath, "pull", image}, progressHandler, outputLines);
    }
    catch(libshipyard::Error& e) {
        auto message = boost::format("Failed to pull image '%s'") % image;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }
}

std::size_t DockerDriver::inspectImageSize(const std::string& image) const {
    auto args = libshipyard::CLIArguments{dockerPath, "image", "inspect", "--format", "{{.Size}}", image};
    auto output = boost::algorithm::join(runAndCollectOutput(args), "");
    boost::algorithm::trim(output);
    try {
        return boost::lexical_cast<std::size_t>(output);
    }
    catch(const boost::bad_lexical_cast&) {
        auto message = boost::format("Failed to inspect the size of image '%s': unexpected output '%s'") % image % output;
        SHIPYARD_THROW_ERROR(message.str());
    }
}

void DockerDriver::tagImage(const std::string& image, const std::string& repository, const std::string& tag) const {
    printLog(boost::format("Tagging image '%s' as '%s:%s'") % image % repository % tag, libshipyard::LogLevel::DEBUG);
    runAndCollectOutput(libshipyard::CLIArguments{dockerPath, "tag", image, repository + ":" + tag});
}

std::string DockerDriver::pushImage(const std::string& reference,
                                    const std::string& registryToken,
                                    const ProgressHandler& progressHandler) const {
    printLog(boost::format("Pushing image '%s'") % reference, libshipyard::LogLevel::INFO);

    auto args = libshipyard::CLIArguments{dockerPath};
    auto configDirectory = libshipyard::PathRAII{};
    if(!registryToken.empty()) {
        configDirectory = libshipyard::PathRAII{config->makeTemporaryPath("shipyard-docker-config")};
        writeRegistryTokenConfig(configDirectory.getPath(), reference, registryToken);
        args += libshipyard::CLIArguments{"--config", configDirectory.getPath().string()};
    }
    args += libshipyard::CLIArguments{"push", reference};

    auto outputLines = std::vector<std::string>{};
    try {
        runAndForwardProgress(args, progressHandler, outputLines);
    }
    catch(libshipyard::Error& e) {
        auto message = boost::format("Failed to push image '%s'") % reference;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }
    return parsePushDigest(outputLines);
}

void DockerDriver::removeImage(const std::string& reference) const {
    printLog(boost::format("Removing image '%s'") % reference, libshipyard::LogLevel::DEBUG);
    runAndCollectOutput(libshipyard::CLIArguments{dockerPath, "image", "rm", reference});
}

std::vector<std::string> DockerDriver::runAndCollectOutput(const libshipyard::CLIArguments& args) const {
    auto outputLines = std::vector<std::string>{};
    auto status = libshipyard::process::forkExecWait(args, mergeStderrIntoStdout, {}, [&outputLines](const std::string& line) {
        outputLines.push_back(removeTrailingNewline(line));
    });
    if(status != 0) {
        auto message = boost::format("Command '%s' exited with status %d. Output:\n%s")
            % args % status % boost::algorithm::join(outputLines, "\n");
        SHIPYARD_THROW_ERROR(message.str());
    }
    return outputLines;
}

void DockerDriver::runAndForwardProgress(const libshipyard::CLIArguments& args,
                                         const ProgressHandler& progressHandler,
                                         std::vector<std::string>& outputLines) const {
    auto status = libshipyard::process::forkExecWait(args, mergeStderrIntoStdout, {},
        [&progressHandler, &outputLines](const std::string& line) {
            auto trimmed = removeTrailingNewline(line);
            if(trimmed.empty()) {
                return;
            }
            outputLines.push_back(trimmed);
            if(progressHandler) {
                progressHandler(parseProgressLine(trimmed));
            }
        });
    if(status != 0) {
        auto lastLine = outputLines.empty() ? std::string{} : outputLines.back();
        auto message = boost::format("Command '%s' exited with status %d: %s") % args % status % lastLine;
        SHIPYARD_THROW_ERROR(message.str());
    }
}

void DockerDriver::writeRegistryTokenConfig(const boost::filesystem::path& configDirectory,
                                            const std::string& reference,
                                            const std::string& registryToken) const {
    auto registry = getRegistryOfReference(reference);
    printLog(boost::format("Writing registry token for '%s' to %s") % registry % configDirectory,
             libshipyard::LogLevel::DEBUG);

    auto json = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = json.GetAllocator();
    auto auth = rapidjson::Value{rapidjson::kObjectType};
    auth.AddMember("registrytoken", rapidjson::Value{registryToken.c_str(), allocator}, allocator);
    auto auths = rapidjson::Value{rapidjson::kObjectType};
    auths.AddMember(rapidjson::Value{registry.c_str(), allocator}, auth, allocator);
    json.AddMember("auths", auths, allocator);

    libshipyard::filesystem::createFoldersIfNecessary(configDirectory);
    auto configFile = configDirectory / "config.json";
    libshipyard::json::write(json, configFile);
    libshipyard::filesystem::setPermissions(configFile, 0600);
}

void DockerDriver::printLog(const boost::format& message, libshipyard::LogLevel level,
                            std::ostream& outStream, std::ostream& errStream) const {
    printLog(message.str(), level, outStream, errStream);
}

void DockerDriver::printLog(const std::string& message, libshipyard::LogLevel level,
                            std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

static std::string stringifyOptionValue(const rapidjson::Value& value) {
    if(value.IsString()) {
        return value.GetString();
    }
    return libshipyard::json::serialize(value);
}

libshipyard::CLIArguments makeBuildArguments(const rapidjson::Value& options) {
    auto args = libshipyard::CLIArguments{};
    if(!options.IsObject()) {
        SHIPYARD_THROW_ERROR("Build options must be a JSON object");
    }

    for(const auto& option : options.GetObject()) {
        auto name = std::string{option.name.GetString()};
        const auto& value = option.value;

        if(name == "t") {
            args += libshipyard::CLIArguments{"--tag", stringifyOptionValue(value)};
        }
        else if(name == "dockerfile") {
            args += libshipyard::CLIArguments{"--file", stringifyOptionValue(value)};
        }
        else if(name == "buildargs" || name == "labels") {
            if(!value.IsObject()) {
                auto message = boost::format("Build option '%s' must be a JSON object") % name;
                SHIPYARD_THROW_ERROR(message.str());
            }
            auto flag = name == "buildargs" ? std::string{"--build-arg"} : std::string{"--label"};
            for(const auto& entry : value.GetObject()) {
                args += libshipyard::CLIArguments{flag, std::string{entry.name.GetString()} + "=" + stringifyOptionValue(entry.value)};
            }
        }
        else if(name == "cachefrom") {
            if(value.IsArray()) {
                for(const auto& image : value.GetArray()) {
                    args += libshipyard::CLIArguments{"--cache-from", stringifyOptionValue(image)};
                }
            }
            else {
                args += libshipyard::CLIArguments{"--cache-from", stringifyOptionValue(value)};
            }
        }
        else if(name == "nocache" || name == "pull" || name == "squash" || name == "forcerm") {
            if(value.IsBool() && value.GetBool()) {
                auto flag = name == "nocache" ? std::string{"--no-cache"}
                          : name == "forcerm" ? std::string{"--force-rm"}
                          : "--" + name;
                args.push_back(flag);
            }
        }
        else if(name == "rm") {
            if(value.IsBool() && !value.GetBool()) {
                args.push_back("--rm=false");
            }
        }
        else if(name == "platform" || name == "target") {
            args += libshipyard::CLIArguments{"--" + name, stringifyOptionValue(value)};
        }
        else if(name == "networkmode") {
            args += libshipyard::CLIArguments{"--network", stringifyOptionValue(value)};
        }
        else if(name == "extrahosts") {
            args += libshipyard::CLIArguments{"--add-host", stringifyOptionValue(value)};
        }
        else {
            libshipyard::logMessage(boost::format("Ignoring unsupported build option '%s'") % name,
                                    libshipyard::LogLevel::WARN);
        }
    }

    return args;
}

rapidjson::Document parseProgressLine(const std::string& line) {
    static const boost::regex layerLine{"^([0-9a-f]{12}): (.+)$"};
    static const boost::regex pullingFromLine{"^(\\S+): (Pulling from .+)$"};

    auto event = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = event.GetAllocator();
    auto matches = boost::smatch{};

    if(boost::starts_with(line, "Error") || boost::starts_with(line, "error")) {
        event.AddMember("error", rapidjson::Value{line.c_str(), allocator}, allocator);
    }
    else if(boost::regex_match(line, matches, layerLine) || boost::regex_match(line, matches, pullingFromLine)) {
        event.AddMember("id", rapidjson::Value{matches[1].str().c_str(), allocator}, allocator);
        event.AddMember("status", rapidjson::Value{matches[2].str().c_str(), allocator}, allocator);
    }
    else {
        event.AddMember("status", rapidjson::Value{line.c_str(), allocator}, allocator);
    }
    return event;
}

std::string parsePushDigest(const std::vector<std::string>& outputLines) {
    static const boost::regex digestPattern{"digest: (sha256:[0-9a-f]{64})"};
    for(auto line = outputLines.rbegin(); line != outputLines.rend(); ++line) {
        auto matches = boost::smatch{};
        if(boost::regex_search(*line, matches, digestPattern)) {
            return matches[1].str();
        }
    }
    SHIPYARD_THROW_ERROR("Failed to find the manifest digest in the output of docker push");
}

std::string getRegistryOfReference(const std::string& reference) {
    auto slash = reference.find('/');
    if(slash == std::string::npos) {
        return "docker.io";
    }
    auto component = reference.substr(0, slash);
    if(component.find('.') != std::string::npos
       || component.find(':') != std::string::npos
       || component == "localhost") {
        return component;
    }
    return "docker.io";
}

}
}
