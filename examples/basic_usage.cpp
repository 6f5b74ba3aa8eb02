#include <iostream>
#include <string>
#include <vector>

#include <fwio.hpp>

using namespace fwio;

int main() {
    std::cout << "FWIO Basic Usage Example\n";
    std::cout << "========================\n\n";

    // Layout: 2-byte code, 20-byte country, 10-byte language (right aligned)
    auto layout = LayoutBuilder()
                      .fields({2, 20, 10})
                      .align({Alignment::left, Alignment::left, Alignment::right})
                      .comment('#')
                      .line_ending(LineEnding::lf)
                      .trim()
                      .build();

    auto check = check_layout(layout);
    if (!check.is_valid()) {
        std::cerr << "Invalid layout: " << error_code_string(check.error) << "\n";
        return 1;
    }
    std::cout << "Line width: " << check.width << " bytes\n\n";

    // Write records into memory
    const std::vector<Record> countries{
        {"us", "United States", "English"},
        {"za", "South Africa", "Afrikaans"},
        {"de", "Germany", "German"},
    };

    RecordWriter writer(io::StringSink{}, layout);
    if (auto err = writer.write_comment("code country             language"); !err.ok()) {
        std::cerr << "Comment failed: " << err.message() << "\n";
        return 1;
    }
    if (auto err = writer.write_all(countries); !err.ok()) {
        std::cerr << "Write failed: " << err.message() << "\n";
        return 1;
    }

    std::cout << "Encoded output:\n";
    std::cout << writer.sink().str() << "\n";

    // Read them back
    RecordReader reader(io::StringSource(writer.sink().str()), layout);
    auto result = reader.read_all();
    if (!result.is_valid()) {
        std::cerr << "Read failed: " << result.error.message() << "\n";
        return 1;
    }

    std::cout << "Decoded " << result.records.size() << " records:\n";
    for (const auto& rec : result.records) {
        std::cout << "  [" << rec[0] << "] [" << rec[1] << "] [" << rec[2] << "]\n";
    }

    // An oversized field is rejected when trimming is off
    writer.layout().trim_fields = false;
    auto err = writer.write({"gb", "United Kingdom of Great Britain", "English"});
    std::cout << "\nOversized field without trim: " << err.message() << "\n";

    return 0;
}
