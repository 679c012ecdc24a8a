#include <enslink/proxy/marshaller.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string_view>

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

        std::string lookup_expression(int64_t id) { return "session.obj_instance(" + std::to_string(id) + ")"; }

    } // namespace

    Marshaller::Marshaller(ProxyCache &cache, const SubtypeTable &subtypes, Evaluator evaluator, EnumLookup enums)
        : cache_(cache), subtypes_(subtypes), evaluator_(std::move(evaluator)), enums_(std::move(enums)) {
        if (!evaluator_) {
            throw std::invalid_argument("Marshaller requires an evaluator");
        }
    }

    std::string Marshaller::discriminator_query(int64_t id, const std::string &attribute) {
        return "ensight.objs.wrap_id(" + std::to_string(id) + ").getattr(ensight.objs.enums." + attribute + ")";
    }

    Result<MarshalledResult> Marshaller::marshal(const std::string &text) {
        cache_.prune();

        auto scan = scan_object_references(text);

        MarshalledResult result;
        result.complete = scan.complete;
        result.references = scan.reference_count();

        std::string expression;
        std::vector<ValuePiece> pieces;
        pieces.reserve(scan.segments.size());

        for (const auto &segment : scan.segments) {
            if (!segment.is_reference()) {
                expression += segment.text;
                pieces.push_back(ValuePiece{segment.text, nullptr});
                continue;
            }

            const auto &reference = segment.reference;
            ProxyPtr handle = cache_.find(reference.id);
            if (handle) {
                expression += lookup_expression(reference.id);
            } else {
                auto fresh = resolve(reference, result);
                if (!fresh) {
                    return fresh.error_as<MarshalledResult>();
                }
                handle = std::move(fresh.value);
                expression += constructor_expression(*handle);
            }
            pieces.push_back(ValuePiece{"", handle});
        }

        expression = std::string(trim(expression));
        if (expression.size() >= 2 && expression.front() == '[' && expression.back() == ']') {
            expression = "ensobjlist(" + expression + ")";
        }

        if (scan.complete) {
            auto parsed = parse_value(pieces);
            if (parsed) {
                result.value = std::move(parsed.value);
            } else {
                result.value = Value(RawText{expression});
            }
        } else {
            spdlog::debug("Malformed object description, result kept as text");
            result.value = Value(RawText{expression});
        }

        result.expression = std::move(expression);
        return Result<MarshalledResult>::ok(std::move(result));
    }

    Result<ProxyPtr> Marshaller::resolve(const ObjectReference &reference, MarshalledResult &result) {
        auto handle = std::make_shared<ProxyHandle>();
        handle->id = reference.id;
        handle->class_name = reference.class_name;

        if (const auto *entry = subtypes_.find(reference.class_name)) {
            ++result.round_trips;
            auto reply = evaluator_(discriminator_query(reference.id, entry->attribute));
            if (!reply) {
                return reply.error_as<ProxyPtr>();
            }

            auto discriminator = parse_value(reply.value);
            if (discriminator && discriminator.value.is_int()) {
                const int64_t value = discriminator.value.as_int();
                auto it = entry->subclasses.find(value);
                if (it != entry->subclasses.end()) {
                    handle->class_name = it->second;
                    handle->discriminator = entry->attribute;
                    handle->discriminator_value = value;
                    if (enums_) {
                        handle->discriminator_id = enums_(entry->attribute);
                    }
                } else {
                    spdlog::debug("Unknown {} value {} for object {}, keeping {}", entry->attribute, value,
                                  reference.id, reference.class_name);
                }
            } else {
                spdlog::debug("Discriminator of object {} is not an integer: {}", reference.id, reply.value);
            }
        }

        auto stored = cache_.insert(handle);
        if (stored == handle) {
            ++result.resolved;
        }
        return Result<ProxyPtr>::ok(std::move(stored));
    }

    std::string Marshaller::constructor_expression(const ProxyHandle &handle) const {
        std::string text = "session.ensight.objs." + handle.class_name + "(session, " + std::to_string(handle.id);
        if (handle.discriminator && handle.discriminator_value) {
            const std::string attr_id = handle.discriminator_id ? std::to_string(*handle.discriminator_id)
                                                                : "ensight.objs.enums." + *handle.discriminator;
            text += ",attr_id=" + attr_id + ", attr_value=" + std::to_string(*handle.discriminator_value);
        }
        return text + ")";
    }

} // namespace enslink::proxy
