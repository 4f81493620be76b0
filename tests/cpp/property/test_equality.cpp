#include <catch2/catch_test_macros.hpp>
#include <propmap/property/access.h>
#include <propmap/property/decorator.h>

using namespace propmap;

namespace equality_test {

    struct DiskArgs : PropertyObject {
        static void declare(ClassBuilder<DiskArgs> &cls) {
            cls.field<std::string>("name").field<Optional<int64_t>>("size", property("sizeGb"));
        }
    };

    // Same fields as DiskArgs, different class
    struct VolumeArgs : PropertyObject {
        static void declare(ClassBuilder<VolumeArgs> &cls) {
            cls.field<std::string>("name").field<Optional<int64_t>>("size", property("sizeGb"));
        }
    };

    struct DiskResult : PropertyObject {
        static void declare(ClassBuilder<DiskResult> &cls) { cls.field<std::string>("id"); }
    };

    // Compares by name only
    struct NamedArgs : PropertyObject {
        static void declare(ClassBuilder<NamedArgs> &cls) {
            cls.field<std::string>("name").field<std::string>("comment");
        }

        [[nodiscard]] bool equals(const PropertyObject &other) const override {
            const auto *named = dynamic_cast<const NamedArgs *>(&other);
            return named != nullptr && get(*this, "name") == get(*named, "name");
        }
    };

    struct LabelsResult : MappingObject {
        using MappingObject::MappingObject;

        static void declare(ClassBuilder<LabelsResult> &cls) { cls.field<std::string>("env"); }
    };

    struct Plain : PropertyObject {};

    // Every instance equals every other
    struct LenientArgs : PropertyObject {
        [[nodiscard]] bool equals(const PropertyObject &) const override { return true; }
    };

    struct StrictArgs : LenientArgs {
        static void declare(ClassBuilder<StrictArgs> &cls) { cls.base<LenientArgs>().field<int64_t>("other"); }
    };

    struct DiskCopyArgs : DiskArgs {};

    void decorate_all() {
        static bool decorated = [] {
            mark_as_input_type<DiskArgs>();
            mark_as_input_type<VolumeArgs>();
            mark_as_output_type<DiskResult>();
            mark_as_input_type<NamedArgs>();
            mark_as_output_type<LabelsResult>();
            mark_as_input_type<StrictArgs>();
            return true;
        }();
        (void)decorated;
    }

}  // namespace equality_test

using namespace equality_test;

TEST_CASE("equality - input types compare their stores", "[equality]") {
    decorate_all();
    DiskArgs first;
    DiskArgs second;

    REQUIRE(first == second);

    set_attr(first, "name", "d1");
    REQUIRE_FALSE(first == second);

    set_attr(second, "name", "d1");
    REQUIRE(first == second);

    set_attr(second, "size", 10);
    REQUIRE_FALSE(first == second);
}

TEST_CASE("equality - a store never created differs from an empty one", "[equality]") {
    decorate_all();
    auto empty_payload = make_output<DiskResult>(ValueMap{});
    DiskResult default_constructed;

    REQUIRE(make_output<DiskResult>(ValueMap{}) == empty_payload);
    REQUIRE_FALSE(default_constructed == empty_payload);
}

TEST_CASE("equality - different classes are never equal", "[equality]") {
    decorate_all();
    DiskArgs disk;
    VolumeArgs volume;
    set_attr(disk, "name", "d1");
    set_attr(volume, "name", "d1");

    REQUIRE_FALSE(disk == volume);
    REQUIRE_FALSE(volume == disk);
}

TEST_CASE("equality - output types compare their payloads", "[equality]") {
    decorate_all();

    REQUIRE(make_output<DiskResult>(ValueMap{{"id", "i1"}}) == make_output<DiskResult>(ValueMap{{"id", "i1"}}));
    REQUIRE_FALSE(make_output<DiskResult>(ValueMap{{"id", "i1"}}) == make_output<DiskResult>(ValueMap{{"id", "i2"}}));
}

TEST_CASE("equality - copies compare equal", "[equality]") {
    decorate_all();
    DiskArgs original;
    set_attr(original, "size", 5);
    DiskArgs copy{original};

    REQUIRE(copy == original);

    set_attr(copy, "size", 6);
    REQUIRE_FALSE(copy == original);
}

TEST_CASE("equality - a class's own equality is kept", "[equality]") {
    decorate_all();
    const auto &definition = ClassRegistry::instance().get(typeid(NamedArgs));
    NamedArgs first;
    NamedArgs second;
    set_attr(first, "name", "n");
    set_attr(second, "name", "n");
    set_attr(first, "comment", "a");
    set_attr(second, "comment", "b");

    REQUIRE(definition.has_own_equality);
    REQUIRE_FALSE(definition.synthesized_equality);
    REQUIRE(first == second);
}

TEST_CASE("equality - mapping types compare as mappings", "[equality]") {
    decorate_all();
    auto labels = make_output<LabelsResult>(ValueMap{{"env", "prod"}});
    MappingObject same_items{ValueMap{{"env", "prod"}}};

    REQUIRE_FALSE(ClassRegistry::instance().get(typeid(LabelsResult)).synthesized_equality);
    REQUIRE(labels == same_items);
    REQUIRE(same_items == labels);
    REQUIRE_FALSE(labels == MappingObject{ValueMap{{"env", "dev"}}});
}

TEST_CASE("equality - undecorated classes compare by identity", "[equality]") {
    Plain first;
    Plain second;

    REQUIRE(first == first);
    REQUIRE_FALSE(first == second);
}

TEST_CASE("equality - synthesized equality overrides an inherited equals", "[equality]") {
    decorate_all();
    StrictArgs first;
    StrictArgs second;
    set_attr(first, "other", 1);
    set_attr(second, "other", 2);

    REQUIRE_FALSE(ClassRegistry::instance().get(typeid(StrictArgs)).has_own_equality);
    REQUIRE_FALSE(first == second);

    set_attr(second, "other", 1);
    REQUIRE(first == second);

    // the base keeps its own
    REQUIRE(LenientArgs{} == LenientArgs{});
}

TEST_CASE("equality - subclasses adding nothing compare structurally", "[equality]") {
    decorate_all();
    DiskCopyArgs first;
    DiskCopyArgs second;
    set_attr(first, "name", "d1");

    REQUIRE_FALSE(first == second);

    set_attr(second, "name", "d1");
    REQUIRE(first == second);
}
