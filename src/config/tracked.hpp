/*
 * Copyright 2025 Headlamp Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tracked option value: Unset | Default(v) | Explicit(v)

#pragma once

#include <string_view>
#include <utility>

namespace headlamp::config {

/// Where a tracked value came from
enum class ValueSource {
    Unset,     // No value at all
    Default,   // Compiled default, environment, or a conditional override
    Explicit,  // Supplied on the command line
};

[[nodiscard]] constexpr std::string_view to_string(ValueSource source) noexcept {
    switch (source) {
        case ValueSource::Unset:
            return "unset";
        case ValueSource::Default:
            return "default";
        case ValueSource::Explicit:
            return "explicit";
    }
    return "unset";
}

/// Value paired with its provenance
/// Conditional overrides consult source() and must leave Explicit values alone.
template <typename T>
class Tracked {
public:
    constexpr Tracked() = default;

    [[nodiscard]] static Tracked unset() { return Tracked{}; }

    [[nodiscard]] static Tracked defaulted(T value) {
        return Tracked{ValueSource::Default, std::move(value)};
    }

    [[nodiscard]] static Tracked explicit_value(T value) {
        return Tracked{ValueSource::Explicit, std::move(value)};
    }

    [[nodiscard]] ValueSource source() const noexcept { return source_; }
    [[nodiscard]] bool is_set() const noexcept { return source_ != ValueSource::Unset; }
    [[nodiscard]] bool is_explicit() const noexcept { return source_ == ValueSource::Explicit; }

    /// Plain value; T{} when unset
    [[nodiscard]] const T& value() const noexcept { return value_; }

    /// Replace the value unless the user supplied it explicitly
    /// Returns true if the override was applied.
    bool override_default(T value) {
        if (is_explicit()) {
            return false;
        }
        source_ = ValueSource::Default;
        value_ = std::move(value);
        return true;
    }

    bool operator==(const Tracked& other) const = default;

private:
    Tracked(ValueSource source, T value) : source_(source), value_(std::move(value)) {}

    ValueSource source_ = ValueSource::Unset;
    T value_{};
};

}  // namespace headlamp::config
