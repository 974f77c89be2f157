#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include "terse/terse.hpp"

// =============================================================================
// terse-inspect: print the string table of a dedup-mode file
// =============================================================================
//
// Usage: terse-inspect <file> [--payload]
//
// Exit codes: 0 success, 1 usage or file error, 2 malformed data.
//
// =============================================================================

namespace {

// Table strings come from the file; never send raw control characters
// (C0, DEL or the two-byte C1 range) to the terminal.
auto escape(const std::string& s) -> std::string {
    static const char* digits = "0123456789abcdef";
    auto hex = [](std::string& out, unsigned char byte) {
        out += "\\x";
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    };

    std::string result;
    result.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        auto c = s[i];
        auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:
                if (byte < 0x20 || byte == 0x7F) {
                    hex(result, byte);
                } else if (byte == 0xC2 && i + 1 < s.size() &&
                           static_cast<unsigned char>(s[i + 1]) < 0xA0) {
                    hex(result, byte);
                    hex(result, static_cast<unsigned char>(s[++i]));
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

void print_table(const terse::dedup_context& table) {
    std::cout << "string table: " << table.size() << " entries, "
              << table.encoded_size() << " bytes\n";

    auto index = std::size_t{0};
    for (const auto& s : table) {
        std::cout << "  [" << std::setw(4) << index++ << "] "
                  << std::setw(6) << s.size() << "  \"" << escape(s) << "\"\n";
    }
}

void print_hex(const std::vector<uint8_t>& bytes) {
    constexpr std::size_t per_line = 16;
    auto flags = std::cout.flags();
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i % per_line == 0) {
            if (i > 0) std::cout << "\n";
            std::cout << "  " << std::hex << std::setw(8) << std::setfill('0') << i << " ";
        }
        std::cout << " " << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(bytes[i]);
    }
    if (!bytes.empty()) std::cout << "\n";
    std::cout.flags(flags);
    std::cout << std::setfill(' ');
}

} // namespace

int main(int argc, char* argv[]) {
    auto show_payload = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--payload") == 0) {
            show_payload = true;
        } else if (path == nullptr) {
            path = argv[i];
        } else {
            path = nullptr;
            break;
        }
    }

    if (path == nullptr) {
        std::cerr << "Usage: " << argv[0] << " <file> [--payload]\n";
        return 1;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: cannot open file '" << path << "'\n";
        return 1;
    }

    try {
        auto table = terse::dedup_context::read_from(file);
        auto payload = std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                            std::istreambuf_iterator<char>());

        print_table(table);
        std::cout << "payload: " << payload.size() << " bytes\n";
        if (show_payload) {
            print_hex(payload);
        }
    } catch (const terse::error& e) {
        std::cerr << "Error reading '" << path << "' (" << terse::to_string(e.kind())
                  << "): " << e.what() << "\n";
        return 2;
    }

    return 0;
}
