#ifndef BREPKIT_STEP_WRITER_HPP
#define BREPKIT_STEP_WRITER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace brepkit {
namespace step {

// Instance number of an emitted entity (#n). Numbering starts at 1.
using EntityId = uint32_t;

// Contents of the HEADER section
struct StepHeader {
    std::string description;
    std::string implementation_level = "2;1";
    std::string file_name;
    std::string time_stamp;
    std::string author;
    std::string organization;
    std::string preprocessor_version;
    std::string originating_system;
    std::string authorization;
    std::string schema;
};

// Append-only buffer of DATA section entities.
// Each add() takes the next instance number; nothing is renumbered or merged,
// so an entity can only reference entities added before it.
class StepWriter {
public:
    StepWriter() = default;

    // Record `#n=<entity>;` and return n
    EntityId add(const std::string& entity);

    size_t entity_count() const { return entities_.size(); }
    EntityId last_id() const { return next_id_ - 1; }

    // ISO-10303-21 file: HEADER, DATA, ENDSEC, END-ISO-10303-21
    std::string to_string(const StepHeader& header) const;

    // "#n"
    static std::string ref(EntityId id);

    // Quoted string literal body (no surrounding quotes): ' -> '' and \ -> \\.
    // UTF-8 input outside printable ASCII is written as \X2\hhhh\X0\
    // (\X4\hhhhhhhh\X0\ beyond the BMP), control characters as \X\hh.
    static std::string escape(const std::string& text);

    // Quoted, escaped string literal
    static std::string str(const std::string& text);

    // Fixed-point REAL; never produces a negative zero
    static std::string real(double value, int precision = 6);

    // .T. / .F.
    static std::string logical(bool value);

    // (#a,#b,...)
    static std::string list(const std::vector<EntityId>& ids);

    // (x,y,z) as REALs
    static std::string triple(double x, double y, double z);

private:
    EntityId next_id_ = 1;
    std::vector<std::string> entities_;
};

}  // namespace step
}  // namespace brepkit

#endif // BREPKIT_STEP_WRITER_HPP
