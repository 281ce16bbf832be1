#include "batch_processor.hpp"
#include "reporting.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace RootVision {

nlohmann::json BatchResult::toJson() const {
    nlohmann::json j;
    j["processed"] = processed;
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& f : failed) {
        failures.push_back({{"file", f.filename}, {"error", f.error}});
    }
    j["failed"] = failures;
    return j;
}

static bool isImageFile(const fs::path& path) {
    static const std::set<std::string> extensions = {".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp"};
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extensions.count(ext) > 0;
}

std::vector<std::string> listImages(const std::string& input_path) {
    std::vector<std::string> files;
    std::error_code ec;

    if (fs::is_regular_file(input_path, ec)) {
        files.push_back(input_path);
        return files;
    }
    if (!fs::is_directory(input_path, ec)) {
        std::cerr << "Input path not found: " << input_path << std::endl;
        return files;
    }

    for (const auto& entry : fs::directory_iterator(input_path, ec)) {
        if (entry.is_regular_file() && isImageFile(entry.path())) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool saveArtifacts(const StageContext& context, const std::string& stem, const OutputConfig& output) {
    std::error_code ec;
    fs::create_directories(output.directory, ec);
    if (ec) {
        std::cerr << "Failed to create output directory " << output.directory << ": " << ec.message() << std::endl;
        return false;
    }

    const fs::path base = fs::path(output.directory) / stem;
    bool ok = true;

    if (output.save_masks) {
        for (const char* name : {"rmask", "seed_map"}) {
            if (!context.contains(name)) continue;
            const auto& mask = context.get<SerializableMask>(name);
            const std::string path = base.string() + "_" + name + ".png";
            if (!mask.save(path)) {
                std::cerr << "Failed to write " << path << std::endl;
                ok = false;
            }
        }
    }

    if (output.save_tree && context.contains("tree")) {
        const std::string path = base.string() + "_tree.json";
        nlohmann::json j = context.get<RootTree>("tree").toJson();
        if (context.contains("bbox")) {
            const auto& bbox = context.get<cv::Rect>("bbox");
            j["bbox"] = {{"x", bbox.x}, {"y", bbox.y}, {"width", bbox.width}, {"height", bbox.height}};
        }
        if (context.contains("seed_map")) {
            j["seed_map_policy"] = context.get<SerializableMask>("seed_map").policy().toJson();
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to write " << path << std::endl;
            ok = false;
        } else {
            file << j.dump(2);
        }
    }

    return ok;
}

BatchResult processBatch(const std::vector<std::string>& files, const Pipeline& pipeline,
                         const OutputConfig& output, bool verbose) {
    BatchResult result;
    const size_t total = files.size();

    for (size_t i = 0; i < total; ++i) {
        const std::string& filename = files[i];
        std::cout << "processing (img " << (i + 1) << "/" << total << "): " << filename << std::endl;

        try {
            StageContext context;
            context.set("filename", filename);
            StageContext outputs = pipeline.run(context, verbose);

            const std::string stem = fs::path(filename).stem().string();
            if (!saveArtifacts(outputs, stem, output)) {
                result.failed.push_back({filename, "failed to write artifacts"});
                continue;
            }
            result.processed++;
        } catch (const std::exception& e) {
            printError(e);
            result.failed.push_back({filename, e.what()});
        }
    }

    return result;
}

} // namespace RootVision
