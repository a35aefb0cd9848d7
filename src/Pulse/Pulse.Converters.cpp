module;
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <entt/entt.hpp>
#include <glm/glm.hpp>

module Pulse.Converters;

import Core.Logging;

namespace Pulse
{
    namespace
    {
        std::string_view Trim(std::string_view text)
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
            return text;
        }

        // Whole (trimmed) field must parse; a leading '+' is accepted.
        template <typename T>
        bool ParseNumber(std::string_view text, T& out)
        {
            text = Trim(text);
            if (!text.empty() && text.front() == '+') text.remove_prefix(1);
            if (text.empty()) return false;

            const char* first = text.data();
            const char* last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }

        // Splits on ',' into exactly N floats.
        template <size_t N>
        bool ParseComponents(std::string_view text, float (&out)[N])
        {
            size_t index = 0;
            while (true)
            {
                const size_t comma = text.find(',');
                const std::string_view field = text.substr(0, comma);
                if (index >= N || !ParseNumber(field, out[index])) return false;
                ++index;

                if (comma == std::string_view::npos) break;
                text.remove_prefix(comma + 1);
            }
            return index == N;
        }
    }

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    bool ConverterRegistry::Register(ConverterInfo info)
    {
        if (!info.Factory)
        {
            Core::Log::Warn("ConverterRegistry: '{}' has no factory; ignored.", info.Name);
            return false;
        }

        const PairKey key{info.SourceType.hash(), info.DestinationType.hash()};

        std::unique_lock lock(m_Mutex);
        if (auto it = m_Converters.find(key); it != m_Converters.end())
        {
            Core::Log::Warn("ConverterRegistry: duplicate registration for '{}' -> '{}' ('{}' kept, '{}' ignored)",
                            info.SourceType.name(), info.DestinationType.name(), it->second.Name, info.Name);
            return false;
        }

        Core::Log::Debug("ConverterRegistry: registered '{}' ({} -> {})",
                         info.Name, info.SourceType.name(), info.DestinationType.name());
        m_Converters.emplace(key, std::move(info));
        return true;
    }

    void ConverterRegistry::AddRegistrar(Registrar registrar)
    {
        if (!registrar) return;

        {
            std::lock_guard lock(m_BuildMutex);
            m_Registrars.push_back(registrar);
            if (!m_Built.load(std::memory_order_acquire)) return;
        }

        // Table already built: apply now so the provider is not lost.
        registrar(*this);
    }

    void ConverterRegistry::EnsureBuilt()
    {
        if (m_Built.load(std::memory_order_acquire)) return;

        std::lock_guard lock(m_BuildMutex);
        if (m_Built.load(std::memory_order_relaxed)) return;

        for (const Registrar& registrar : m_Registrars)
            registrar(*this);

        m_Built.store(true, std::memory_order_release);

        std::shared_lock mapLock(m_Mutex);
        Core::Log::Info("ConverterRegistry: built table with {} converter(s).", m_Converters.size());
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    std::optional<ConverterInfo> ConverterRegistry::FindConverterType(const entt::type_info& source,
                                                                      const entt::type_info& destination)
    {
        EnsureBuilt();

        std::shared_lock lock(m_Mutex);
        auto it = m_Converters.find(PairKey{source.hash(), destination.hash()});
        if (it == m_Converters.end()) return std::nullopt;
        return it->second;
    }

    std::unique_ptr<IValueConverter> ConverterRegistry::CreateConverter(const entt::type_info& source,
                                                                        const entt::type_info& destination)
    {
        auto info = FindConverterType(source, destination);
        if (!info)
        {
            Core::Log::Debug("ConverterRegistry: no converter for '{}' -> '{}'", source.name(), destination.name());
            return nullptr;
        }
        return info->Factory();
    }

    size_t ConverterRegistry::Count()
    {
        EnsureBuilt();

        std::shared_lock lock(m_Mutex);
        return m_Converters.size();
    }

    void ConverterRegistry::Clear()
    {
        std::lock_guard buildLock(m_BuildMutex);
        std::unique_lock lock(m_Mutex);
        m_Converters.clear();
        m_Built.store(false, std::memory_order_release);
    }

    // -------------------------------------------------------------------------
    // Built-in converters
    // -------------------------------------------------------------------------

    std::string BoolToStringConverter::ConvertValue(const bool& value) const
    {
        return value ? "True" : "False";
    }

    bool BoolToStringConverter::ConvertBackValue(const std::string& value) const
    {
        std::string lowered(Trim(value));
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered == "true";
    }

    std::string IntToStringConverter::ConvertValue(const int& value) const
    {
        return std::to_string(value);
    }

    int IntToStringConverter::ConvertBackValue(const std::string& value) const
    {
        int result = 0;
        return ParseNumber(value, result) ? result : 0;
    }

    std::string FloatToStringConverter::ConvertValue(const float& value) const
    {
        return std::format("{:.0f}", value);
    }

    float FloatToStringConverter::ConvertBackValue(const std::string& value) const
    {
        float result = 0.0f;
        return ParseNumber(value, result) ? result : 0.0f;
    }

    std::string Vec2ToStringConverter::ConvertValue(const glm::vec2& value) const
    {
        return std::format("{},{}", value.x, value.y);
    }

    glm::vec2 Vec2ToStringConverter::ConvertBackValue(const std::string& value) const
    {
        float c[2] = {};
        if (!ParseComponents(value, c)) return glm::vec2(0.0f);
        return {c[0], c[1]};
    }

    std::string Vec3ToStringConverter::ConvertValue(const glm::vec3& value) const
    {
        return std::format("{},{},{}", value.x, value.y, value.z);
    }

    glm::vec3 Vec3ToStringConverter::ConvertBackValue(const std::string& value) const
    {
        float c[3] = {};
        if (!ParseComponents(value, c)) return glm::vec3(0.0f);
        return {c[0], c[1], c[2]};
    }

    void RegisterBuiltinConverters(ConverterRegistry& registry)
    {
        registry.Register<BoolToStringConverter>("BoolToString");
        registry.Register<IntToStringConverter>("IntToString");
        registry.Register<FloatToStringConverter>("FloatToString");
        registry.Register<Vec2ToStringConverter>("Vec2ToString");
        registry.Register<Vec3ToStringConverter>("Vec3ToString");
    }
}
