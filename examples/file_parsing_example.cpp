#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fwio/fwio_utils.hpp>

using namespace fwio;

/**
 * @brief Record printer functor with internal state
 *
 * Prints each record and keeps a running count.
 */
class RecordPrinter {
private:
    size_t record_num_ = 0; // Internal record counter

public:
    bool operator()(const Record& rec) {
        record_num_++;

        std::cout << "Record " << record_num_ << ":";
        for (const auto& field : rec) {
            std::cout << " [" << field << "]";
        }
        std::cout << "\n";

        // Print up to 30 records (could also return true to print all)
        return record_num_ < 30;
    }

    size_t count() const { return record_num_; }
};

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <file> <width>[,<width>...] [skip_lines]\n";
        return 1;
    }

    const char* filepath = argv[1];

    // Parse comma-separated column widths
    std::vector<int> widths;
    std::string widths_arg = argv[2];
    size_t start = 0;
    while (start <= widths_arg.size()) {
        size_t comma = widths_arg.find(',', start);
        std::string item = widths_arg.substr(
            start, comma == std::string::npos ? std::string::npos : comma - start);
        try {
            widths.push_back(std::stoi(item));
        } catch (const std::exception&) {
            std::cerr << "Invalid width: '" << item << "'\n";
            return 1;
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    int skip_lines = 0;
    if (argc > 3) {
        try {
            skip_lines = std::stoi(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "Invalid skip_lines: '" << argv[3] << "'\n";
            return 1;
        }
    }

    auto layout = LayoutBuilder()
                      .fields(widths)
                      .skip_lines(skip_lines)
                      .comment('#')
                      .line_ending(LineEnding::lf)
                      .trim()
                      .build();

    try {
        FixedWidthFileReader reader(filepath, layout);

        std::cout << "File: " << filepath << "\n";
        std::cout << "Size: " << reader.size() << " bytes\n\n";

        RecordPrinter printer;
        auto result = reader.for_each_record(printer);

        std::cout << "\nPrinted " << printer.count() << " records\n";

        if (!result.is_valid()) {
            std::cerr << "Stopped: " << result.error.message() << "\n";
            return 1;
        }
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
