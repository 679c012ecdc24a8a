#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace enslink::proxy {

    // Markers of the textual object description emitted by the engine:
    //   Class: <ClassName>, <free-form fields>, CvfObjID: <integer>, cached:<yes|no>
    inline constexpr std::string_view CLASS_MARKER = "Class: ";
    inline constexpr std::string_view ID_MARKER = "CvfObjID:";
    inline constexpr std::string_view CACHED_NO = ", cached:no";
    inline constexpr std::string_view CACHED_YES = ", cached:yes";

    struct ObjectReference {
        std::string class_name;
        int64_t id{0};
        bool cached{false};
        size_t begin{0}; // offset of "Class: " in the scanned text
        size_t end{0};   // one past the trailing qualifier
    };

    struct Segment {
        enum class Kind { Literal, Reference };

        Kind kind{Kind::Literal};
        std::string text;          // Literal only
        ObjectReference reference; // Reference only

        bool is_reference() const { return kind == Kind::Reference; }
    };

    struct ScanResult {
        std::vector<Segment> segments;
        // false when the scan stopped at a malformed description; the rest of the
        // text is then carried verbatim in the last literal segment
        bool complete{true};

        size_t reference_count() const;
    };

    // Single left-to-right pass splitting text into literal spans and object references
    ScanResult scan_object_references(std::string_view text);

} // namespace enslink::proxy
