/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <algorithm>

namespace libshipyard {

CLIArguments::CLIArguments(std::initializer_list<std::string> arguments)
    : arguments(arguments)
{}

void CLIArguments::push_back(std::string argument) {
    arguments.push_back(std::move(argument));
}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    arguments.insert(arguments.end(), rhs.arguments.cbegin(), rhs.arguments.cend());
    return *this;
}

int CLIArguments::argc() const {
    return static_cast<int>(arguments.size());
}

char** CLIArguments::argv() const {
    pointers.clear();
    pointers.reserve(arguments.size() + 1);
    for(const auto& argument : arguments) {
        pointers.push_back(const_cast<char*>(argument.c_str()));
    }
    pointers.push_back(nullptr);
    return pointers.data();
}

const std::string& CLIArguments::operator[](std::size_t index) const {
    return arguments.at(index);
}

std::string CLIArguments::string() const {
    auto result = std::string{};
    for(const auto& argument : arguments) {
        if(!result.empty()) {
            result += ' ';
        }
        bool needsQuotes = argument.empty()
            || std::any_of(argument.cbegin(), argument.cend(), [](char c) { return c == ' ' || c == '\t'; });
        if(needsQuotes) {
            result += "'" + argument + "'";
        }
        else {
            result += argument;
        }
    }
    return result;
}

bool operator==(const CLIArguments& lhs, const CLIArguments& rhs) {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

CLIArguments operator+(CLIArguments lhs, const CLIArguments& rhs) {
    lhs += rhs;
    return lhs;
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    return os << args.string();
}

}
