#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace enslink::proxy {

    // Discriminator attribute of one polymorphic base class and its value -> subclass map
    struct SubtypeEntry {
        std::string attribute; // enum name, e.g. "PARTTYPE"
        std::map<int64_t, std::string> subclasses;
    };

    // Immutable table of polymorphic base classes
    class SubtypeTable {
      public:
        SubtypeTable() = default;
        explicit SubtypeTable(std::map<std::string, SubtypeEntry> entries);

        // ENS_PART, ENS_ANNOT and ENS_TOOL
        static const SubtypeTable &standard();

        // nullptr when the class is not polymorphic
        const SubtypeEntry *find(const std::string &class_name) const;

        bool is_polymorphic(const std::string &class_name) const { return find(class_name) != nullptr; }

        // Concrete subclass for the discriminator value, or class_name when unrecognized
        std::string resolve(const std::string &class_name, int64_t value) const;

        size_t size() const { return entries_.size(); }

      private:
        std::map<std::string, SubtypeEntry> entries_;
    };

} // namespace enslink::proxy
