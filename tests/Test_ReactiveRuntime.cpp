#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

import Core;
import Pulse;

using namespace Pulse;

// =========================================================================
// Test: Keyed property with typed and change subscribers
// =========================================================================
TEST(ReactiveRuntime, HealthPropertyEndToEnd)
{
    RuntimeConfig config;
    config.Mode = MarshalMode::Immediate;
    ReactiveRuntime runtime(config);

    auto created = runtime.Properties().GetOrCreateProperty<int>("health", 100);
    ASSERT_TRUE(created.has_value());
    auto health = *created;

    std::vector<int> typed;
    std::vector<std::pair<int, int>> changes;
    auto a = health->Subscribe([&](const int& v) { typed.push_back(v); });
    auto b = health->SubscribeWithPrevious([&](const int& o, const int& n) { changes.emplace_back(o, n); });

    std::vector<std::string> eventKeys;
    auto c = runtime.Events().Subscribe<PropertyChangedEvent>([&](const PropertyChangedEvent& e)
    {
        eventKeys.push_back(e.Key);
    });

    auto untyped = runtime.Properties().GetProperty("health");
    ASSERT_NE(untyped, nullptr);
    ASSERT_TRUE(untyped->SetValue(entt::any{80}).has_value());

    EXPECT_EQ(entt::any_cast<int>(runtime.Properties().GetProperty("health")->GetValue()), 80);
    EXPECT_EQ(typed, (std::vector<int>{80}));
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0], std::make_pair(100, 80));
    EXPECT_EQ(eventKeys, (std::vector<std::string>{"health"}));
}

// =========================================================================
// Test: Computed value over store properties
// =========================================================================
TEST(ReactiveRuntime, ComputedSumOverStoreProperties)
{
    ReactiveRuntime runtime;
    auto& store = runtime.Properties();

    auto a = *store.GetOrCreateProperty<int>("a", 2);
    auto b = *store.GetOrCreateProperty<int>("b", 3);

    auto sum = std::make_shared<ComputedCell<int>>([a, b] { return a->Get() + b->Get(); });
    sum->TrackDependency(*a);
    sum->TrackDependency(*b);
    ASSERT_TRUE(store.RegisterProperty("sum", sum).has_value());

    EXPECT_EQ(sum->Value(), 5);

    std::vector<std::string> keys;
    auto sub = runtime.Events().Subscribe<PropertyChangedEvent>([&](const PropertyChangedEvent& e)
    {
        keys.push_back(e.Key);
    });

    a->Set(4);
    EXPECT_TRUE(sum->IsDirty());
    EXPECT_EQ((*store.GetComputedProperty<int>("sum"))->Value(), 7);
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "sum"}));
}

// =========================================================================
// Test: Queued mode delivers worker writes on Tick
// =========================================================================
TEST(ReactiveRuntime, QueuedModeDeliversOnTick)
{
    ReactiveRuntime runtime;
    ASSERT_NE(runtime.Dispatcher(), nullptr);
    EXPECT_EQ(runtime.Config().Mode, MarshalMode::Queued);

    auto score = *runtime.Properties().GetOrCreateProperty<int>("score", 0);

    std::thread::id deliveredOn;
    int cellValue = 0;
    int busValue = 0;
    auto a = score->Subscribe([&](const int& v)
    {
        cellValue = v;
        deliveredOn = std::this_thread::get_id();
    });
    auto b = runtime.Events().Subscribe<PropertyChangedEvent>([&](const PropertyChangedEvent& e)
    {
        busValue = entt::any_cast<int>(e.NewValue);
    });

    std::thread worker([&] { score->Set(12); });
    worker.join();

    EXPECT_EQ(score->Get(), 12);
    EXPECT_EQ(cellValue, 0);
    EXPECT_EQ(busValue, 0);

    // One action for the cell subscribers, one for the bus handlers.
    EXPECT_EQ(runtime.Tick(), 2u);
    EXPECT_EQ(cellValue, 12);
    EXPECT_EQ(busValue, 12);
    EXPECT_EQ(deliveredOn, std::this_thread::get_id());
    EXPECT_EQ(runtime.Tick(), 0u);
}

TEST(ReactiveRuntime, CellsOutliveTheRuntimeAfterLeavingTheStore)
{
    auto runtime = std::make_unique<ReactiveRuntime>();
    auto hp = *runtime->Properties().GetOrCreateProperty<int>("hp", 1);
    auto mana = *runtime->Properties().GetOrCreateProperty<int>("mana", 1);

    runtime->Properties().ClearNonPersistentProperties();
    runtime.reset();

    int notified = 0;
    auto sub = hp->Subscribe([&](const int& v) { notified = v; });

    // Unbound cells notify inline on any thread.
    hp->Set(2);
    std::thread worker([&] { mana->Set(3); });
    worker.join();

    EXPECT_EQ(notified, 2);
    EXPECT_EQ(hp->Get(), 2);
    EXPECT_EQ(mana->Get(), 3);
}

TEST(ReactiveRuntime, ImmediateModeHasNoDispatcher)
{
    RuntimeConfig config;
    config.Mode = MarshalMode::Immediate;
    ReactiveRuntime runtime(config);

    EXPECT_EQ(runtime.Dispatcher(), nullptr);
    EXPECT_TRUE(runtime.Threading().IsMainThread());
    EXPECT_EQ(runtime.Tick(), 0u);
    EXPECT_TRUE(runtime.Events().IsInitialized());
}

// =========================================================================
// Test: Converters are wired in
// =========================================================================
TEST(ReactiveRuntime, BuiltinConvertersAvailableByDefault)
{
    ReactiveRuntime runtime;
    EXPECT_EQ(runtime.Converters().Count(), 5u);

    RuntimeConfig bare;
    bare.RegisterBuiltins = false;
    ReactiveRuntime empty(bare);
    EXPECT_EQ(empty.Converters().Count(), 0u);
}

TEST(ReactiveRuntime, BindingThroughConverter)
{
    ReactiveRuntime runtime;
    auto volume = *runtime.Properties().GetOrCreateProperty<int>("volume", 7);
    auto text = *runtime.Properties().GetOrCreateProperty<std::string>("volume.text", "");

    auto converter = runtime.Converters().CreateConverter(volume->ValueType(), text->ValueType());
    ASSERT_NE(converter, nullptr);

    auto sub = volume->SubscribeBoxed([&](const entt::any& v)
    {
        (void)text->SetValue(converter->Convert(v));
    }, true);
    EXPECT_EQ(text->Get(), "7");

    volume->Set(11);
    EXPECT_EQ(text->Get(), "11");

    ASSERT_TRUE(volume->SetValue(converter->ConvertBack(entt::any{std::string("3")})).has_value());
    EXPECT_EQ(volume->Get(), 3);
    EXPECT_EQ(text->Get(), "3");
}

// =========================================================================
// Test: Framework errors surface on the bus
// =========================================================================
TEST(ReactiveRuntime, TypeMismatchRaisesFrameworkError)
{
    RuntimeConfig config;
    config.Mode = MarshalMode::Immediate;
    ReactiveRuntime runtime(config);
    Core::Log::SetSink([](Core::Log::Level, std::string_view) {});

    auto speed = *runtime.Properties().GetOrCreateProperty<float>("speed", 1.0f);

    std::vector<ErrorSeverity> severities;
    auto sub = runtime.Events().Subscribe<FrameworkErrorEvent>([&](const FrameworkErrorEvent& e)
    {
        severities.push_back(e.Severity);
        EXPECT_EQ(e.Code, Core::ErrorCode::TypeMismatch);
        EXPECT_EQ(*e.Source(), "Pulse.Framework");
    });

    auto result = speed->SetValue(entt::any{std::string("fast")});
    Core::Log::ResetSink();

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(severities, (std::vector<ErrorSeverity>{ErrorSeverity::Error}));
    EXPECT_FLOAT_EQ(speed->Get(), 1.0f);
}
