#include <adfmd-json/adf_json.hpp>
#include <adfmd/converter.hpp>
#include <adfmd/document.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view usage =
    "usage: adfmd-converter <to-md|to-adf> [--plain] [--no-inline-cards]\n";

enum exit_code : int
{
    success = 0,
    usage_error = 1,
    load_error = 2,
    conversion_error = 3
};

} // namespace

int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    if (argc < 2)
    {
        std::cerr << usage;
        return usage_error;
    }

    const std::string_view mode = argv[1];
    if (mode != "to-md" && mode != "to-adf")
    {
        std::cerr << usage;
        return usage_error;
    }

    adfmd::converter::config cfg;

    for (int i = 2; i < argc; ++i)
    {
        const std::string_view flag = argv[i];

        if (flag == "--plain")
        {
            cfg.emit_annotations = false;
        }
        else if (flag == "--no-inline-cards")
        {
            cfg.infer_inline_cards = false;
        }
        else
        {
            std::cerr << "((ADFMD ERROR))(?): unknown option '" << flag
                      << "'\n\n"
                      << usage;

            return usage_error;
        }
    }

    std::string input_buffer;
    input_buffer.reserve(128000);

    std::string line_buffer;
    line_buffer.reserve(512);

    while (std::getline(std::cin, line_buffer))
    {
        input_buffer.append(line_buffer);
        input_buffer.append(1, '\n');
    }

    adfmd::converter converter{std::cerr};

    if (mode == "to-md")
    {
        adfmd::node document;
        if (!adfmd::read_adf_json(input_buffer, document, std::cerr))
        {
            return load_error;
        }

        std::string output_buffer;
        output_buffer.reserve(input_buffer.size());

        if (!converter.to_markdown(cfg, output_buffer, document))
        {
            return conversion_error;
        }

        std::cout << output_buffer;
        return success;
    }

    adfmd::node document;
    const bool clean = converter.from_markdown(cfg, document, input_buffer);

    // The recovered tree is written even when the text had problems.
    std::cout << adfmd::write_adf_json(document) << std::endl;
    return clean ? success : conversion_error;
}
