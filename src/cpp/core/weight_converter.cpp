#include <modelhub/weight_converter.h>
#include <modelhub/error_types.h>
#include <modelhub/utils/json_utils.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace modelhub {

using utils::JsonUtils;
using json = nlohmann::json;

static const std::set<std::string> WEIGHT_EXTENSIONS = {".pt", ".pth", ".bin", ".safetensors"};
static const std::set<std::string> COMPANION_EXTENSIONS = {".json", ".yaml", ".txt", ".model", ".mvn"};

static std::string lower_extension(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// "model.pt" -> "model.pt", "sub/Model Weights.PTH" -> "sub_model_weights.pth"
static std::string normalised_weight_name(const fs::path& relative) {
    std::string out;
    std::string stem = relative.parent_path().empty()
        ? relative.stem().string()
        : (relative.parent_path() / relative.stem()).generic_string();
    for (unsigned char c : stem) {
        if (std::isalnum(c) || c == '.' || c == '-') {
            out += static_cast<char>(std::tolower(c));
        } else {
            out += '_';
        }
    }
    return out + lower_extension(relative);
}

ConversionResult ParaformerConverter::convert(const std::string& input_dir, const std::string& output_dir) {
    if (!fs::is_directory(input_dir)) {
        throw ConversionError("Conversion input is not a directory: " + input_dir);
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw ConversionError("Failed to create output directory " + output_dir + ": " + ec.message());
    }

    ConversionResult result;
    size_t weights = 0;
    json mapping = json::array();

    try {
        std::vector<fs::path> inputs;
        for (const auto& entry : fs::recursive_directory_iterator(input_dir)) {
            if (entry.is_regular_file()) {
                inputs.push_back(entry.path());
            }
        }
        std::sort(inputs.begin(), inputs.end());

        for (const auto& path : inputs) {
            fs::path relative = fs::relative(path, input_dir);
            std::string ext = lower_extension(path);

            std::string target;
            std::string role;
            if (WEIGHT_EXTENSIONS.count(ext)) {
                target = normalised_weight_name(relative);
                role = "weights";
                weights++;
            } else if (COMPANION_EXTENSIONS.count(ext)) {
                target = relative.generic_string();
                role = "config";
            } else {
                result.unmapped++;
                continue;
            }

            fs::path dest = fs::path(output_dir) / target;
            fs::create_directories(dest.parent_path());
            fs::copy_file(path, dest, fs::copy_options::overwrite_existing);
            result.converted++;
            mapping.push_back({{"source", relative.generic_string()}, {"target", target}, {"role", role}});
        }
    } catch (const fs::filesystem_error& e) {
        throw ConversionError(std::string("Conversion failed: ") + e.what());
    }

    if (weights == 0) {
        throw ConversionError("No weight files found in " + input_dir);
    }

    json manifest = {
        {"converter", name()},
        {"converted", result.converted},
        {"unmapped", result.unmapped},
        {"files", mapping}
    };
    try {
        JsonUtils::save_to_file(manifest, (fs::path(output_dir) / "conversion.json").string());
    } catch (const FilesystemError& e) {
        throw ConversionError(std::string("Failed to write conversion manifest: ") + e.what());
    }

    std::cout << "[WeightConverter] Converted " << result.converted << " files ("
              << result.unmapped << " unmapped)" << std::endl;
    return result;
}

std::unique_ptr<WeightConverter> make_converter(const std::string& name) {
    if (name == "paraformer") {
        return std::make_unique<ParaformerConverter>();
    }
    return nullptr;
}

} // namespace modelhub
