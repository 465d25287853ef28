#ifndef label_generator_hh_INCLUDED
#define label_generator_hh_INCLUDED

#include "array_view.hh"
#include "string.hh"
#include "unordered_map.hh"

#include <memory>

namespace Bibsync
{

// Turns bibliography positions (1-based) into display labels.
// Non positive positions are unassigned and render as nothing.
class LabelGenerator
{
public:
    virtual ~LabelGenerator() = default;

    virtual String get_label(int position) const = 0;
    virtual String get_label(ConstArrayView<int> positions) const = 0;
};

struct LabelGeneratorParameters
{
    String label_template = "$"; // $ is replaced with the rendered positions
    String separator = ",";
    bool compress_ranges = false;  // 1,2,3,5 -> 1-3,5
};

class TemplateLabelGenerator : public LabelGenerator
{
public:
    explicit TemplateLabelGenerator(LabelGeneratorParameters params)
        : m_params{std::move(params)} {}

    String get_label(int position) const override;
    String get_label(ConstArrayView<int> positions) const override;

    const LabelGeneratorParameters& parameters() const { return m_params; }

protected:
    virtual String render(int position) const = 0;

private:
    String apply_template(StringView content) const;

    LabelGeneratorParameters m_params;
};

class NumberedLabelGenerator final : public TemplateLabelGenerator
{
public:
    using TemplateLabelGenerator::TemplateLabelGenerator;

protected:
    String render(int position) const override;
};

// a, b, ..., z, aa, ab, ...
class AlphabeticLabelGenerator final : public TemplateLabelGenerator
{
public:
    using TemplateLabelGenerator::TemplateLabelGenerator;

protected:
    String render(int position) const override;
};

using LabelGeneratorFactory = std::unique_ptr<LabelGenerator> (*)(const LabelGeneratorParameters& params);

struct LabelGeneratorFactoryAndDocstring
{
    LabelGeneratorFactory factory;
    const char* docstring;
};

class LabelGeneratorRegistry
{
public:
    // registers the numbered and alphabetic generators
    LabelGeneratorRegistry();

    void register_generator(String name, LabelGeneratorFactoryAndDocstring desc);
    bool has_generator(StringView name) const;
    std::unique_ptr<LabelGenerator> create(StringView name,
                                           const LabelGeneratorParameters& params) const;

private:
    UnorderedMap<String, LabelGeneratorFactoryAndDocstring, MemoryDomain::Labels> m_generators;
};

}

#endif // label_generator_hh_INCLUDED
