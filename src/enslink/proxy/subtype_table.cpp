#include <enslink/proxy/subtype_table.hpp>

#include <initializer_list>
#include <utility>

namespace enslink::proxy {

    namespace {

        SubtypeEntry prefixed(const std::string &attribute, const std::string &prefix,
                              std::initializer_list<std::pair<int64_t, const char *>> values) {
            SubtypeEntry entry;
            entry.attribute = attribute;
            for (const auto &[value, suffix] : values) {
                entry.subclasses.emplace(value, prefix + suffix);
            }
            return entry;
        }

        std::map<std::string, SubtypeEntry> standard_entries() {
            std::map<std::string, SubtypeEntry> entries;

            entries.emplace("ENS_PART", prefixed("PARTTYPE", "ENS_PART_",
                                                 {{0, "MODEL"},
                                                  {1, "CLIP"},
                                                  {2, "CONTOUR"},
                                                  {3, "DISCRETE_PARTICLE"},
                                                  {4, "FRAME"},
                                                  {5, "ISOSURFACE"},
                                                  {6, "PARTICLE_TRACE"},
                                                  {7, "PROFILE"},
                                                  {8, "VECTOR_ARROW"},
                                                  {9, "ELEVATED_SURFACE"},
                                                  {10, "DEVELOPED_SURFACE"},
                                                  {15, "BUILTUP"},
                                                  {16, "TENSOR_GLYPH"},
                                                  {17, "FX_VORTEX_CORE"},
                                                  {18, "FX_SHOCK"},
                                                  {19, "FX_SEP_ATT"},
                                                  {20, "MAT_INTERFACE"},
                                                  {21, "POINT"},
                                                  {22, "AXISYMMETRIC"},
                                                  {24, "VOF"},
                                                  {25, "AUX_GEOM"},
                                                  {26, "FILTER"}}));

            entries.emplace("ENS_ANNOT", prefixed("ANNOTTYPE", "ENS_ANNOT_",
                                                  {{0, "TEXT"},
                                                   {1, "LINE"},
                                                   {2, "LOGO"},
                                                   {3, "LGND"},
                                                   {4, "MARKER"},
                                                   {5, "ARROW"},
                                                   {6, "DIAL"},
                                                   {7, "GAUGE"},
                                                   {8, "SHAPE"}}));

            entries.emplace("ENS_TOOL", prefixed("TOOLTYPE", "ENS_TOOL_",
                                                 {{0, "CURSOR"},
                                                  {1, "LINE"},
                                                  {2, "PLANE"},
                                                  {3, "BOX"},
                                                  {4, "CYLINDER"},
                                                  {5, "CONE"},
                                                  {6, "SPHERE"},
                                                  {7, "REVOLUTION"}}));
            return entries;
        }

    } // namespace

    SubtypeTable::SubtypeTable(std::map<std::string, SubtypeEntry> entries) : entries_(std::move(entries)) {}

    const SubtypeTable &SubtypeTable::standard() {
        static const SubtypeTable table(standard_entries());
        return table;
    }

    const SubtypeEntry *SubtypeTable::find(const std::string &class_name) const {
        auto it = entries_.find(class_name);
        return it == entries_.end() ? nullptr : &it->second;
    }

    std::string SubtypeTable::resolve(const std::string &class_name, int64_t value) const {
        const auto *entry = find(class_name);
        if (!entry) {
            return class_name;
        }
        auto it = entry->subclasses.find(value);
        return it == entry->subclasses.end() ? class_name : it->second;
    }

} // namespace enslink::proxy
