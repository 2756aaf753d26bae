/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libshipyard_CLIArguments_hpp
#define libshipyard_CLIArguments_hpp

#include <initializer_list>
#include <ostream>
#include <string>
#include <cstddef>
#include <vector>

namespace libshipyard {

/**
 * Command line of a subprocess (docker, tar) or of the shipyard program itself.
 *
 * The arguments are owned as strings. argv() exposes them as the null-terminated
 * vector expected by execvp and boost::program_options; the returned pointers stay
 * valid until the next modification of the object.
 */
class CLIArguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    CLIArguments() = default;
    CLIArguments(std::initializer_list<std::string> arguments);
    template<class InputIter>
    CLIArguments(InputIter first, InputIter last)
        : arguments(first, last)
    {}

    void push_back(std::string argument);
    CLIArguments& operator+=(const CLIArguments& rhs);

    int argc() const;
    char** argv() const;
    const std::string& operator[](std::size_t index) const;

    const_iterator begin() const { return arguments.cbegin(); }
    const_iterator end() const { return arguments.cend(); }
    std::size_t size() const { return arguments.size(); }
    bool empty() const { return arguments.empty(); }
    void clear() { arguments.clear(); }

    // Space-separated, arguments containing blanks are single-quoted
    std::string string() const;

private:
    std::vector<std::string> arguments;
    mutable std::vector<char*> pointers;
};

bool operator==(const CLIArguments&, const CLIArguments&);
CLIArguments operator+(CLIArguments, const CLIArguments&);
std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif
