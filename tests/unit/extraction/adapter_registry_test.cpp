#include <gtest/gtest.h>
#include <chatmine/extraction/chatdata_adapter.h>
#include <chatmine/extraction/composer_adapter.h>
#include <chatmine/extraction/format_adapter.h>

using namespace chatmine;
using namespace chatmine::extraction;

namespace {

class NamedAdapter : public IFormatAdapter {
public:
    explicit NamedAdapter(std::string name) : name_(std::move(name)) {}
    std::string name() const override { return name_; }
    Result<AdapterOutput> extract(storage::IKeyValueSource&, const ExtractionContext&) override {
        return AdapterOutput{};
    }

private:
    std::string name_;
};

AdapterRegistry::AdapterCreator named(const std::string& name) {
    return [name] { return std::make_unique<NamedAdapter>(name); };
}

} // namespace

TEST(AdapterRegistryTest, BuiltinsAreModernFirst) {
    auto registry = AdapterRegistry::withBuiltins();
    ASSERT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.names(),
              (std::vector<std::string>{std::string(ComposerAdapter::kName),
                                        std::string(ChatDataAdapter::kName)}));

    auto composer = registry.create("composer");
    ASSERT_NE(composer, nullptr);
    EXPECT_EQ(composer->name(), "composer");
    auto chatdata = registry.create("chatdata");
    ASSERT_NE(chatdata, nullptr);
    EXPECT_EQ(chatdata->name(), "chatdata");
}

TEST(AdapterRegistryTest, UnknownNameCreatesNothing) {
    auto registry = AdapterRegistry::withBuiltins();
    EXPECT_FALSE(registry.contains("future"));
    EXPECT_EQ(registry.create("future"), nullptr);
}

TEST(AdapterRegistryTest, RegistrationOrderIsPrecedence) {
    AdapterRegistry registry;
    registry.registerAdapter("b", named("b"));
    registry.registerAdapter("a", named("a"));
    registry.registerAdapter("c", named("c"));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"b", "a", "c"}));
}

TEST(AdapterRegistryTest, ReplacingKeepsPosition) {
    AdapterRegistry registry;
    registry.registerAdapter("first", named("first"));
    registry.registerAdapter("second", named("second"));
    registry.registerAdapter("first", named("replacement"));

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(registry.create("first")->name(), "replacement");
}

TEST(AdapterRegistryTest, EachCreateIsAFreshInstance) {
    auto registry = AdapterRegistry::withBuiltins();
    auto a = registry.create("composer");
    auto b = registry.create("composer");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a.get(), b.get());
}
