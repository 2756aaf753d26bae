/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "DockerfileTransposer.hpp"

#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "context/Archive.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace emulation {

static bool isContinued(const std::string& line) {
    auto trimmed = boost::algorithm::trim_right_copy(line);
    return !trimmed.empty() && trimmed.back() == '\\';
}

static bool isCommentOrBlank(const std::string& line) {
    auto trimmed = boost::algorithm::trim_copy(line);
    return trimmed.empty() || trimmed.front() == '#';
}

static std::string escapeRegex(const std::string& value) {
    static const boost::regex specialCharacters{R"([.^$|()\[\]{}*+?\\])"};
    return boost::regex_replace(value, specialCharacters, R"(\\$&)");
}

// Parses a JSON array of strings, as found in the exec form of instructions
static bool parseStringArray(const std::string& text, std::vector<std::string>& values) {
    auto json = rapidjson::Document{};
    json.Parse(text.c_str());
    if(json.HasParseError() || !json.IsArray()) {
        return false;
    }
    values.clear();
    for(const auto& value : json.GetArray()) {
        if(!value.IsString()) {
            return false;
        }
        values.emplace_back(value.GetString(), value.GetStringLength());
    }
    return true;
}

static std::string makeExecForm(const std::vector<std::string>& arguments) {
    auto quoted = std::vector<std::string>{};
    for(const auto& argument : arguments) {
        quoted.push_back(quoteJsonString(argument));
    }
    return "[" + boost::algorithm::join(quoted, ", ") + "]";
}

std::string quoteJsonString(const std::string& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
    return buffer.GetString();
}

DockerfileTransposer::DockerfileTransposer(std::shared_ptr<const common::Config> config, const TransposeOptions& options)
    : config{std::move(config)}
    , options(options)
{}

std::string DockerfileTransposer::transposeDockerfile(const std::string& dockerfile) const {
    auto lines = std::vector<std::string>{};
    boost::algorithm::split(lines, dockerfile, boost::is_any_of("\n"));

    auto copyInstruction = "COPY " + makeExecForm({options.hostEmulatorPath, options.containerEmulatorPath});
    auto output = std::vector<std::string>{};

    for(std::size_t i = 0; i < lines.size(); ) {
        auto instruction = std::vector<std::string>{ lines[i++] };
        auto trimmed = boost::algorithm::trim_copy(instruction.front());
        if(trimmed.empty() || trimmed.front() == '#') {
            output.push_back(instruction.front());
            continue;
        }
        // comments and blank lines inside a continuation do not end it
        while(i < lines.size()
              && (isContinued(instruction.back()) || (instruction.size() > 1 && isCommentOrBlank(instruction.back())))) {
            instruction.push_back(lines[i++]);
        }

        auto keyword = boost::algorithm::to_upper_copy(trimmed.substr(0, trimmed.find_first_of(" \t")));
        if(keyword == "FROM") {
            output.insert(output.end(), instruction.begin(), instruction.end());
            output.push_back(copyInstruction);
        }
        else if(keyword == "RUN") {
            // join the physical lines the way the daemon does: comments and escaped newlines go away
            auto arguments = std::string{};
            for(std::size_t k = 0; k < instruction.size(); ++k) {
                auto part = instruction[k];
                if(k > 0 && isCommentOrBlank(part)) {
                    continue;
                }
                if(isContinued(part)) {
                    boost::algorithm::trim_right(part);
                    part.pop_back();
                }
                arguments += part;
            }
            boost::algorithm::trim(arguments);
            arguments = boost::algorithm::trim_copy(arguments.substr(keyword.size()));
            output.push_back(transposeRun(arguments));
        }
        else {
            output.insert(output.end(), instruction.begin(), instruction.end());
        }
    }

    return boost::algorithm::join(output, "\n");
}

std::string DockerfileTransposer::transposeRun(const std::string& arguments) const {
    auto command = std::vector<std::string>{ options.containerEmulatorPath, "-execve" };
    auto execArguments = std::vector<std::string>{};
    if(!arguments.empty() && arguments.front() == '[' && parseStringArray(arguments, execArguments)) {
        command.insert(command.end(), execArguments.begin(), execArguments.end());
    }
    else {
        command.insert(command.end(), { "/bin/sh", "-c", arguments });
    }
    return "RUN " + makeExecForm(command);
}

libshipyard::PathRAII DockerfileTransposer::transposeArchive(const boost::filesystem::path& archive) const {
    auto outputPath = config->makeTemporaryPath("shipyard-transposed");
    outputPath += ".tar";
    auto output = libshipyard::PathRAII{outputPath};

    try {
        auto reader = context::ArchiveReader{archive};
        auto writer = context::ArchiveWriter{output.getPath()};
        bool isDockerfileFound = false;

        auto entry = context::ArchiveEntry{};
        while(reader.nextEntry(entry)) {
            if(entry.name == options.dockerfile) {
                entry.data = transposeDockerfile(entry.data);
                isDockerfileFound = true;
            }
            else if(entry.name == options.hostEmulatorPath) {
                entry.mode = options.emulatorFileMode;
            }
            writer.addEntry(entry);
        }

        if(!isDockerfileFound) {
            auto message = boost::format("Dockerfile '%s' not found in build context") % options.dockerfile;
            SHIPYARD_THROW_ERROR(message.str());
        }

        if(!writer.hasEntry(options.hostEmulatorPath)) {
            if(options.emulatorBinary.empty()) {
                auto message = boost::format("Emulator '%s' not found in build context") % options.hostEmulatorPath;
                SHIPYARD_THROW_ERROR(message.str());
            }
            auto emulator = context::ArchiveEntry{};
            emulator.name = options.hostEmulatorPath;
            emulator.data = libshipyard::filesystem::readFile(options.emulatorBinary);
            emulator.mode = options.emulatorFileMode;
            writer.addEntry(emulator);
        }

        writer.finalize();
    }
    catch(libshipyard::Error& e) {
        auto message = boost::format("Failed to transpose build context %s") % archive;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }

    return output;
}

BuildOutputFilter::BuildOutputFilter(const std::string& containerEmulatorPath)
    : transposedRunPattern{"^(.*?\\bRUN )\\[\\s*\"" + escapeRegex(containerEmulatorPath)
                           + "\"\\s*,\\s*\"-execve\"\\s*,\\s*(.*)\\]\\s*$"}
{}

std::string BuildOutputFilter::filter(const std::string& line) const {
    auto matches = boost::smatch{};
    if(!boost::regex_match(line, matches, transposedRunPattern)) {
        return line;
    }

    auto arguments = std::vector<std::string>{};
    if(!parseStringArray("[" + matches[2].str() + "]", arguments)) {
        return line;
    }
    if(arguments.size() == 3 && arguments[0] == "/bin/sh" && arguments[1] == "-c") {
        return matches[1].str() + arguments[2];
    }
    return matches[1].str() + makeExecForm(arguments);
}

}
}
