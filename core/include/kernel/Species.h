#ifndef SPECIES_H
#define SPECIES_H

#include <cstdint>
#include <string>
#include <vector>

// ---------- Observed Parameter ----------
// Something an agent samples from its environment at every step. The sample
// width is 1 (value) or 3 (value, x, y of the location where it was found).
// The heading parameter is special: its two slots come from the agent's path
// and are never stored in the observation buffer.
class Parameter {
public:
    Parameter(std::string name, int sampleWidth = 1);

    static const Parameter& heading();

    const std::string& name() const { return name_; }
    int sampleWidth() const { return width_; }
    bool isHeading() const { return heading_; }

    bool operator==(const Parameter& other) const;
    bool operator!=(const Parameter& other) const { return !(*this == other); }

    static constexpr int kValueOffset = 0;
    static constexpr int kXOffset = 1;
    static constexpr int kYOffset = 2;
    static constexpr int kLocatedWidth = 3;
    static constexpr int kHeadingWidth = 2;

private:
    struct HeadingTag {};
    explicit Parameter(HeadingTag);

    std::string name_;
    int width_;
    bool heading_ = false;
};

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

inline bool operator==(const Color& a, const Color& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }

struct LocalizedName {
    std::string locale;  // "fr_FR", "en", or empty for an unlocalized name
    std::string name;
};

// Perception area relative to the agent, nautical miles. The major radius lies
// along the heading; forwardOffset shifts the centre ahead of the agent.
struct PerceptionTemplate {
    double alongHeading = 20.0;
    double acrossHeading = 10.0;
    double forwardOffset = 0.0;
};

// ---------- Species ----------
// Immutable definition shared by agents: names, display colour, the ordered
// observed parameters and the fixed-width record layout derived from them.
class Species {
public:
    Species(std::vector<LocalizedName> names, Color color,
            std::vector<Parameter> parameters,
            PerceptionTemplate perception = PerceptionTemplate());

    std::uint64_t id() const { return id_; }

    // Names
    std::string name(const std::string& locale = std::string()) const;
    const std::vector<LocalizedName>& names() const { return names_; }
    Color color() const { return color_; }

    // Record layout
    const std::vector<Parameter>& parameters() const { return parameters_; }
    const std::vector<int>& offsets() const { return offsets_; }
    int recordWidth() const { return offsets_.back(); }
    int reducedRecordWidth() const { return reducedWidth_; }
    int storedOffset(std::size_t index) const { return storedOffsets_[index]; }  // -1 for heading
    int indexOf(const std::string& parameterName) const;  // -1 if absent
    bool hasHeading() const { return headingIndex_ >= 0; }
    int headingIndex() const { return headingIndex_; }
    bool layoutCompatible(const Species& other) const { return parameters_ == other.parameters_; }

    const PerceptionTemplate& perception() const { return perception_; }

    bool operator==(const Species& other) const;
    bool operator!=(const Species& other) const { return !(*this == other); }

private:
    std::uint64_t id_;
    std::vector<LocalizedName> names_;
    Color color_;
    std::vector<Parameter> parameters_;
    std::vector<int> offsets_;        // size parameters_.size() + 1
    std::vector<int> storedOffsets_;  // offsets within the reduced record
    int reducedWidth_ = 0;
    int headingIndex_ = -1;
    PerceptionTemplate perception_;
};

#endif // SPECIES_H
