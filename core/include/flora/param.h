#pragma once

/**
 * @file param.h
 * @brief Named, range-limited tunable values
 *
 * A Param combines a value with its metadata (name, range, default) so
 * configuration code can load, validate and describe settings without
 * repeating the same information in several places.
 *
 * @par Example
 * @code
 * Param<float> fps{"fps", 60.0f, 1.0f, 240.0f};
 *
 * fps = 500.0f;
 * if (fps.clamp()) {
 *     // value was out of range and is now 240
 * }
 * @endcode
 */

#include <algorithm>
#include <string>

namespace flora {

/**
 * @brief Parameter data types
 */
enum class ParamType {
    Float,  ///< Single float value
    Int,    ///< Integer value
    Bool    ///< Boolean toggle
};

/**
 * @brief Parameter declaration for introspection (help text, config dumps)
 */
struct ParamDecl {
    std::string name;       ///< Key used in config files
    ParamType type;         ///< Data type
    float minVal = 0.0f;    ///< Minimum value
    float maxVal = 1.0f;    ///< Maximum value
    float defaultVal = 0.0f; ///< Default value
};

/**
 * @brief Type traits mapping C++ types to ParamType enum
 * @tparam T C++ type
 */
template<typename T> struct ParamTypeFor;
template<> struct ParamTypeFor<float> { static constexpr ParamType value = ParamType::Float; };
template<> struct ParamTypeFor<int>   { static constexpr ParamType value = ParamType::Int; };
template<> struct ParamTypeFor<bool>  { static constexpr ParamType value = ParamType::Bool; };

/**
 * @brief Scalar parameter wrapper (float, int, bool)
 * @tparam T Value type (float, int, or bool)
 *
 * Supports implicit conversion so it can be used like a regular value.
 */
template<typename T>
class Param {
public:
    /**
     * @brief Construct a parameter
     * @param name Key for config files and messages
     * @param defaultVal Default value
     * @param minVal Minimum allowed value
     * @param maxVal Maximum allowed value
     */
    Param(const char* name, T defaultVal, T minVal = T{}, T maxVal = T{1})
        : m_name(name), m_value(defaultVal), m_default(defaultVal), m_min(minVal), m_max(maxVal) {}

    /// @brief Implicit conversion to value type
    operator T() const { return m_value; }

    /// @brief Get value explicitly
    T get() const { return m_value; }

    /// @brief Assign a new value (not clamped, see clamp())
    Param& operator=(T v) {
        m_value = v;
        return *this;
    }

    /// @brief Restore the default value
    void reset() { m_value = m_default; }

    /// @brief Check whether the current value lies inside [min, max]
    bool inRange() const { return !(m_value < m_min) && !(m_max < m_value); }

    /**
     * @brief Clamp the value into [min, max]
     * @return true if the value had to be changed
     */
    bool clamp() {
        if (inRange()) return false;
        m_value = std::clamp(m_value, m_min, m_max);
        return true;
    }

    /// @brief Get parameter name
    const char* name() const { return m_name; }

    /// @brief Get minimum value
    T min() const { return m_min; }

    /// @brief Get maximum value
    T max() const { return m_max; }

    /**
     * @brief Generate ParamDecl for introspection
     */
    ParamDecl decl() const {
        return {m_name, ParamTypeFor<T>::value,
                static_cast<float>(m_min), static_cast<float>(m_max),
                static_cast<float>(m_default)};
    }

private:
    const char* m_name;
    T m_value;
    T m_default;
    T m_min, m_max;
};

} // namespace flora
