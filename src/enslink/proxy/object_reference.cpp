#include <enslink/proxy/object_reference.hpp>

#include <charconv>

namespace enslink::proxy {

    namespace {

        std::string_view trim(std::string_view text) {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            const auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

        bool parse_id(std::string_view text, int64_t &id) {
            text = trim(text);
            if (text.empty()) {
                return false;
            }
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
            return ec == std::errc() && ptr == text.data() + text.size();
        }

        void push_literal(std::vector<Segment> &segments, std::string_view text) {
            if (text.empty()) {
                return;
            }
            if (!segments.empty() && !segments.back().is_reference()) {
                segments.back().text.append(text);
                return;
            }
            Segment segment;
            segment.kind = Segment::Kind::Literal;
            segment.text = std::string(text);
            segments.push_back(std::move(segment));
        }

    } // namespace

    size_t ScanResult::reference_count() const {
        size_t count = 0;
        for (const auto &segment : segments) {
            if (segment.is_reference()) {
                ++count;
            }
        }
        return count;
    }

    ScanResult scan_object_references(std::string_view text) {
        ScanResult result;
        size_t window = 0; // start of the text not yet emitted

        while (window < text.size()) {
            const auto marker = text.find(ID_MARKER, window);
            if (marker == std::string_view::npos) {
                break;
            }

            // Nearest "Class: " before the marker, never reaching into emitted text
            const auto window_text = text.substr(window, marker - window);
            const auto class_offset = window_text.rfind(CLASS_MARKER);
            if (class_offset == std::string_view::npos) {
                result.complete = false;
                break;
            }
            const size_t class_pos = window + class_offset;

            // Whichever qualifier comes first after the marker
            const auto no_pos = text.find(CACHED_NO, marker);
            const auto yes_pos = text.find(CACHED_YES, marker);
            if (no_pos == std::string_view::npos && yes_pos == std::string_view::npos) {
                result.complete = false;
                break;
            }
            const bool cached =
                no_pos == std::string_view::npos || (yes_pos != std::string_view::npos && yes_pos < no_pos);
            const size_t tail = cached ? yes_pos : no_pos;
            const size_t tail_len = cached ? CACHED_YES.size() : CACHED_NO.size();

            ObjectReference reference;
            const size_t id_begin = marker + ID_MARKER.size();
            if (!parse_id(text.substr(id_begin, tail - id_begin), reference.id)) {
                result.complete = false;
                break;
            }

            const size_t name_begin = class_pos + CLASS_MARKER.size();
            const auto comma = text.find(',', name_begin);
            if (comma == std::string_view::npos || comma > marker) {
                result.complete = false;
                break;
            }
            reference.class_name = std::string(trim(text.substr(name_begin, comma - name_begin)));
            if (reference.class_name.empty()) {
                result.complete = false;
                break;
            }
            reference.cached = cached;
            reference.begin = class_pos;
            reference.end = tail + tail_len;

            push_literal(result.segments, text.substr(window, class_pos - window));

            Segment segment;
            segment.kind = Segment::Kind::Reference;
            segment.reference = std::move(reference);
            window = segment.reference.end;
            result.segments.push_back(std::move(segment));
        }

        if (window < text.size()) {
            push_literal(result.segments, text.substr(window));
        }
        return result;
    }

} // namespace enslink::proxy
