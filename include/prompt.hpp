#ifndef PROMPT_HPP
#define PROMPT_HPP
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Line-based terminal questions. Every question is re-asked after bad
// input, at most MAX_ATTEMPTS times.
class Prompt {
public:
    static const int MAX_ATTEMPTS = 5;

    Prompt(std::istream &in, std::ostream &out);

    std::optional<int> ask_port(const char *question, int min_port = 1);
    std::optional<std::string> ask_address(const char *question);
    // prints the listing, then asks for one name
    std::optional<std::string> ask_file(const std::vector<std::string> &files, const std::string &server);

private:
    std::istream &in;
    std::ostream &out;

    std::optional<std::string> read_line(const char *question);
};

#endif
