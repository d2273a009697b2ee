// csv_parser.hpp
// Simple CSV parser
#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <fstream>

namespace prismag {

    class CSVParser {
    public:
        // Parse a CSV file, skipping blank lines and '#' comments
        static bool parse_file(
            const std::string& filepath,
            std::vector<std::vector<std::string>>& rows,
            bool skip_header = true
        ) {
            std::ifstream file(filepath);
            if (!file.is_open()) {
                return false;
            }

            std::string line;
            bool first_line = true;

            while (std::getline(file, line)) {
                const std::string trimmed = trim(line);
                if (trimmed.empty() || trimmed[0] == '#') {
                    continue;
                }

                if (first_line && skip_header) {
                    first_line = false;
                    continue;
                }
                first_line = false;

                rows.push_back(parse_line(trimmed));
            }

            return true;
        }

        // Parse a single CSV line
        static std::vector<std::string> parse_line(const std::string& line) {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line) {
                if (c == '"') {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes) {
                    tokens.push_back(trim(token));
                    token.clear();
                }
                else {
                    token += c;
                }
            }

            tokens.push_back(trim(token));

            return tokens;
        }

        static std::string trim(const std::string& str) {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        // Convert string to double, false if the whole token is not a number
        static bool to_double(const std::string& str, double& value) {
            std::istringstream iss(str);
            iss >> value;
            return !iss.fail() && iss.eof();
        }
    };

} // namespace prismag
