module;
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <entt/entt.hpp>
#include <glm/glm.hpp>

export module Pulse.Converters;

import Core.Logging;

export namespace Pulse
{
    // --- Converter Base Class ---
    // Bidirectional value conversion used by bindings, e.g. a numeric cell
    // shown in a text field.
    class IValueConverter
    {
    public:
        virtual ~IValueConverter() = default;

        [[nodiscard]] virtual const entt::type_info& SourceType() const = 0;
        [[nodiscard]] virtual const entt::type_info& DestinationType() const = 0;

        // A box of the wrong type converts the destination's (or source's)
        // default value.
        [[nodiscard]] virtual entt::any Convert(const entt::any& value) const = 0;
        [[nodiscard]] virtual entt::any ConvertBack(const entt::any& value) const = 0;
    };

    template <typename S, typename D>
    class ValueConverter : public IValueConverter
    {
    public:
        using SourceValue = S;
        using DestinationValue = D;

        [[nodiscard]] const entt::type_info& SourceType() const final { return entt::type_id<S>(); }
        [[nodiscard]] const entt::type_info& DestinationType() const final { return entt::type_id<D>(); }

        [[nodiscard]] virtual D ConvertValue(const S& value) const = 0;
        [[nodiscard]] virtual S ConvertBackValue(const D& value) const = 0;

        [[nodiscard]] entt::any Convert(const entt::any& value) const final
        {
            if (const S* typed = entt::any_cast<S>(&value)) return entt::any{ConvertValue(*typed)};
            Core::Log::Warn("ValueConverter: Convert expected '{}'.", entt::type_id<S>().name());
            return entt::any{ConvertValue(S{})};
        }

        [[nodiscard]] entt::any ConvertBack(const entt::any& value) const final
        {
            if (const D* typed = entt::any_cast<D>(&value)) return entt::any{ConvertBackValue(*typed)};
            Core::Log::Warn("ValueConverter: ConvertBack expected '{}'.", entt::type_id<D>().name());
            return entt::any{S{}};
        }
    };

    using ConverterFactoryFn = std::function<std::unique_ptr<IValueConverter>()>;

    // Metadata for a registered converter.
    struct ConverterInfo
    {
        std::string Name;
        entt::type_info SourceType;
        entt::type_info DestinationType;
        ConverterFactoryFn Factory;
    };

    // --- Registry ---
    // Maps exact (source, destination) type pairs to converters. Providers are
    // added with AddRegistrar() at startup; the table is built from them once,
    // on the first lookup. No inheritance or coercion matching.
    class ConverterRegistry
    {
    public:
        using Registrar = std::function<void(ConverterRegistry&)>;

        ConverterRegistry() = default;
        ~ConverterRegistry() = default;

        ConverterRegistry(const ConverterRegistry&) = delete;
        ConverterRegistry& operator=(const ConverterRegistry&) = delete;
        ConverterRegistry(ConverterRegistry&&) = delete;
        ConverterRegistry& operator=(ConverterRegistry&&) = delete;

        // ----- Registration -----

        // Returns false if the pair is already taken.
        bool Register(ConverterInfo info);

        // Register a default-constructible ValueConverter<S, D> subclass.
        template <typename TConverter>
        bool Register(std::string name)
        {
            using S = typename TConverter::SourceValue;
            using D = typename TConverter::DestinationValue;
            return Register(ConverterInfo{
                std::move(name),
                entt::type_id<S>(),
                entt::type_id<D>(),
                []() -> std::unique_ptr<IValueConverter> { return std::make_unique<TConverter>(); }});
        }

        // Deferred provider, run when the table is built. Runs immediately if
        // the table is already built.
        void AddRegistrar(Registrar registrar);

        // ----- Query (builds the table on first use) -----

        [[nodiscard]] std::optional<ConverterInfo> FindConverterType(const entt::type_info& source,
                                                                     const entt::type_info& destination);

        template <typename S, typename D>
        [[nodiscard]] std::optional<ConverterInfo> FindConverterType()
        {
            return FindConverterType(entt::type_id<S>(), entt::type_id<D>());
        }

        // nullptr if no converter is registered for the pair.
        [[nodiscard]] std::unique_ptr<IValueConverter> CreateConverter(const entt::type_info& source,
                                                                       const entt::type_info& destination);

        template <typename S, typename D>
        [[nodiscard]] std::unique_ptr<IValueConverter> CreateConverter()
        {
            return CreateConverter(entt::type_id<S>(), entt::type_id<D>());
        }

        // ----- Metadata -----

        [[nodiscard]] size_t Count();
        [[nodiscard]] bool IsBuilt() const { return m_Built.load(std::memory_order_acquire); }

        // Drops every converter. Registrars are kept and run again on the
        // next lookup.
        void Clear();

    private:
        struct PairKey
        {
            entt::id_type Source;
            entt::id_type Destination;
            bool operator==(const PairKey& other) const
            {
                return Source == other.Source && Destination == other.Destination;
            }
        };

        struct PairKeyHash
        {
            size_t operator()(const PairKey& k) const
            {
                return std::hash<entt::id_type>()(k.Source) ^ (std::hash<entt::id_type>()(k.Destination) << 1);
            }
        };

        void EnsureBuilt();

        std::unordered_map<PairKey, ConverterInfo, PairKeyHash> m_Converters;
        mutable std::shared_mutex m_Mutex;

        std::vector<Registrar> m_Registrars;
        std::mutex m_BuildMutex;
        std::atomic<bool> m_Built{false};
    };

    // --- Built-in converters ---

    class BoolToStringConverter final : public ValueConverter<bool, std::string>
    {
    public:
        [[nodiscard]] std::string ConvertValue(const bool& value) const override;
        // Case-insensitive "true"/"false"; anything else is false.
        [[nodiscard]] bool ConvertBackValue(const std::string& value) const override;
    };

    class IntToStringConverter final : public ValueConverter<int, std::string>
    {
    public:
        [[nodiscard]] std::string ConvertValue(const int& value) const override;
        [[nodiscard]] int ConvertBackValue(const std::string& value) const override;
    };

    // Whole numbers only ("3.7" -> "4").
    class FloatToStringConverter final : public ValueConverter<float, std::string>
    {
    public:
        [[nodiscard]] std::string ConvertValue(const float& value) const override;
        [[nodiscard]] float ConvertBackValue(const std::string& value) const override;
    };

    // "x,y"; malformed input parses to zero.
    class Vec2ToStringConverter final : public ValueConverter<glm::vec2, std::string>
    {
    public:
        [[nodiscard]] std::string ConvertValue(const glm::vec2& value) const override;
        [[nodiscard]] glm::vec2 ConvertBackValue(const std::string& value) const override;
    };

    // "x,y,z"; malformed input parses to zero.
    class Vec3ToStringConverter final : public ValueConverter<glm::vec3, std::string>
    {
    public:
        [[nodiscard]] std::string ConvertValue(const glm::vec3& value) const override;
        [[nodiscard]] glm::vec3 ConvertBackValue(const std::string& value) const override;
    };

    // Registers bool, int, float, vec2 and vec3 <-> string.
    void RegisterBuiltinConverters(ConverterRegistry& registry);
}
