#include <filesystem>
#include <iostream>
#include <string>
#include "generator/SampleGenerator.h"

// generate_dataset [out_dir] [copies] [seed]
// Writes one file per family/variant `copies` times into out_dir.
int main(int argc, char** argv) {
    fs::path out_dir = (argc > 1) ? fs::path(argv[1]) : fs::path("test_data");
    int copies = 10;
    uint32_t seed = 1234;

    try {
        if (argc > 2) copies = std::stoi(argv[2]);
        if (argc > 3) seed = static_cast<uint32_t>(std::stoul(argv[3]));
    }
    catch (const std::exception& e) {
        std::cerr << "Usage: generate_dataset [out_dir] [copies] [seed]: " << e.what() << "\n";
        return 1;
    }
    if (copies <= 0) copies = 1;

    SampleGenerator gen(seed);
    try {
        GenStats stats = gen.generate_folder(out_dir.string(), copies);
        stats.print();
    }
    catch (const std::exception& e) {
        std::cerr << "Generation failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Output: " << fs::absolute(out_dir).string() << "\n";
    return 0;
}
