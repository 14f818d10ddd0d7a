#pragma once
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace suf
{
    enum class Behavior : uint8_t
    {
        Rest,
        Thermoregulate,
        Forage,
        Search,
        Brumation,
    };

    enum class Microhabitat : uint8_t
    {
        Burrow,
        Open,
        WinterBurrow,
    };

    enum class CauseOfDeath : uint8_t
    {
        Starved,
        Cold,
        Heat,
    };

    inline constexpr int kBehaviorCount     = 5;
    inline constexpr int kMicrohabitatCount = 3;

    // Behaviors the utility engine chooses between, in utility-vector order.
    inline constexpr std::array kEmergentBehaviors = {Behavior::Rest, Behavior::Thermoregulate, Behavior::Forage};

    constexpr std::string_view toString(const Behavior b)
    {
        switch (b)
        {
            case Behavior::Rest:
                return "Rest";
            case Behavior::Thermoregulate:
                return "Thermoregulate";
            case Behavior::Forage:
                return "Forage";
            case Behavior::Search:
                return "Search";
            case Behavior::Brumation:
                return "Brumation";
        }
        throw std::logic_error("unknown behavior");
    }

    constexpr std::string_view toString(const Microhabitat m)
    {
        switch (m)
        {
            case Microhabitat::Burrow:
                return "Burrow";
            case Microhabitat::Open:
                return "Open";
            case Microhabitat::WinterBurrow:
                return "Winter_Burrow";
        }
        throw std::logic_error("unknown microhabitat");
    }

    constexpr std::string_view toString(const CauseOfDeath c)
    {
        switch (c)
        {
            case CauseOfDeath::Starved:
                return "Starved";
            case CauseOfDeath::Cold:
                return "Cold";
            case CauseOfDeath::Heat:
                return "Heat";
        }
        throw std::logic_error("unknown cause of death");
    }

    // Inverse of toString(Behavior); used when reading coefficient maps from config.
    inline Behavior behaviorFromString(const std::string_view s)
    {
        for (int i = 0; i < kBehaviorCount; ++i)
        {
            const auto b = static_cast<Behavior>(i);
            if (toString(b) == s)
                return b;
        }
        throw std::invalid_argument("unknown behavior label");
    }
} // namespace suf
