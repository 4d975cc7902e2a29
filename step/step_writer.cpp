#include "step_writer.hpp"
#include <iomanip>
#include <sstream>

namespace brepkit {
namespace step {

EntityId StepWriter::add(const std::string& entity) {
    EntityId id = next_id_++;
    entities_.push_back(ref(id) + "=" + entity + ";");
    return id;
}

std::string StepWriter::to_string(const StepHeader& header) const {
    std::ostringstream out;

    out << "ISO-10303-21;\n";
    out << "HEADER;\n";
    out << "FILE_DESCRIPTION((" << str(header.description) << "),"
        << str(header.implementation_level) << ");\n";
    out << "FILE_NAME(" << str(header.file_name) << ","
        << str(header.time_stamp) << ","
        << "(" << str(header.author) << "),"
        << "(" << str(header.organization) << "),"
        << str(header.preprocessor_version) << ","
        << str(header.originating_system) << ","
        << str(header.authorization) << ");\n";
    out << "FILE_SCHEMA((" << str(header.schema) << "));\n";
    out << "ENDSEC;\n";

    out << "DATA;\n";
    for (const auto& line : entities_) {
        out << line << "\n";
    }
    out << "ENDSEC;\n";
    out << "END-ISO-10303-21;\n";

    return out.str();
}

std::string StepWriter::ref(EntityId id) {
    return "#" + std::to_string(id);
}

namespace {

// Decode one UTF-8 sequence starting at text[i] and advance i past it.
// A malformed sequence yields its first byte as a Latin-1 code point.
uint32_t next_code_point(const std::string& text, size_t& i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(text[k]); };
    unsigned char lead = byte(i);

    size_t length = 1;
    uint32_t cp = lead;
    if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        cp = lead & 0x07;
    } else if (lead >= 0xE0 && lead < 0xF0) {
        length = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xC2 && lead < 0xE0) {
        length = 2;
        cp = lead & 0x1F;
    }

    if (length > 1 && i + length <= text.size()) {
        bool ok = true;
        for (size_t k = 1; k < length; ++k) {
            if ((byte(i + k) & 0xC0) != 0x80) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (byte(i + k) & 0x3F);
        }
        if (ok) {
            i += length;
            return cp;
        }
    }

    ++i;
    return lead;
}

void append_hex(std::string& out, uint32_t value, int digits) {
    static const char* HEX = "0123456789ABCDEF";
    for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
        out += HEX[(value >> shift) & 0xF];
    }
}

}  // namespace

std::string StepWriter::escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    // Open \X2\ (UCS-2) or \X4\ (UCS-4) run, 0 when none
    int run = 0;
    auto close_run = [&]() {
        if (run != 0) {
            result += "\\X0\\";
            run = 0;
        }
    };

    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = next_code_point(text, i);

        if (cp >= 0x20 && cp < 0x7F) {
            close_run();
            if (cp == '\'') {
                result += "''";
            } else if (cp == '\\') {
                result += "\\\\";
            } else {
                result += static_cast<char>(cp);
            }
        } else if (cp < 0x80) {
            // Control characters as an 8-bit escape
            close_run();
            result += "\\X\\";
            append_hex(result, cp, 2);
        } else {
            int wanted = cp <= 0xFFFF ? 2 : 4;
            if (run != wanted) {
                close_run();
                result += wanted == 2 ? "\\X2\\" : "\\X4\\";
                run = wanted;
            }
            append_hex(result, cp, wanted == 2 ? 4 : 8);
        }
    }
    close_run();

    return result;
}

std::string StepWriter::str(const std::string& text) {
    return "'" + escape(text) + "'";
}

std::string StepWriter::real(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    std::string s = ss.str();

    // Values that round to zero print as 0.000000, not -0.000000
    if (!s.empty() && s[0] == '-' && s.find_first_not_of("0.", 1) == std::string::npos) {
        s.erase(0, 1);
    }
    return s;
}

std::string StepWriter::logical(bool value) {
    return value ? ".T." : ".F.";
}

std::string StepWriter::list(const std::vector<EntityId>& ids) {
    std::string result = "(";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            result += ",";
        }
        result += ref(ids[i]);
    }
    result += ")";
    return result;
}

std::string StepWriter::triple(double x, double y, double z) {
    return "(" + real(x) + "," + real(y) + "," + real(z) + ")";
}

}  // namespace step
}  // namespace brepkit
