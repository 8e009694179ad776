#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace modelhub {

struct ConversionResult {
    size_t converted = 0;  // files mapped into the output directory
    size_t unmapped = 0;   // files left behind
};

// Post-download transform from a staging directory into the storage location
class WeightConverter {
public:
    virtual ~WeightConverter() = default;

    // Throws ConversionError
    virtual ConversionResult convert(const std::string& input_dir, const std::string& output_dir) = 0;

    virtual std::string name() const = 0;
};

// Lays out a downloaded Paraformer checkpoint the way the ASR runtime loads it
class ParaformerConverter : public WeightConverter {
public:
    ConversionResult convert(const std::string& input_dir, const std::string& output_dir) override;
    std::string name() const override { return "paraformer"; }
};

// Returns nullptr for unknown names
std::unique_ptr<WeightConverter> make_converter(const std::string& name);

} // namespace modelhub
