// vcsv - decode horizontal or vertical person CSV files

#include <vcsv/vcsv.h>
#include <vcsv/cli_args.h>

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void showHelp() {
    std::cout << "vcsv - decode horizontal and vertical CSV records\n\n";
    std::cout << "Usage:\n";
    std::cout << "  vcsv <file> [layout] [--schema <1-4>] [action] [options]\n\n";
    std::cout << "Layout:\n";
    std::cout << "  --auto               Guess from the first lines (default)\n";
    std::cout << "  --horizontal         Header line, then one line per record\n";
    std::cout << "  --vertical           One line per field, one column per record\n\n";
    std::cout << "Actions:\n";
    std::cout << "  (default)            Print every accepted record\n";
    std::cout << "  --count              Print the number of accepted records\n";
    std::cout << "  --fields             List the field labels found in the file\n";
    std::cout << "  --undeclared         List labels the schema does not declare\n\n";
    std::cout << "Options:\n";
    std::cout << "  --schema, -s <n>     Schema version 1-4 (default 4)\n";
    std::cout << "  --mmap-threshold <b> Memory-map files of at least <b> bytes\n";
    std::cout << "  --as-json            Print records as JSON, one per line\n";
    std::cout << "  --verbose, -v        Report layout, source and counts on stderr\n\n";
    std::cout << "Field labels:\n";
    std::cout << "  Name, Age, Email, Phone, Department, StartDate, Notes\n";
    std::cout << "  Skills[0], Languages[1], Address.City, Projects[2].Role\n\n";
    std::cout << "Set VCSV_DEBUG=1 for library tracing.\n";
}

}  // anonymous namespace

int main(int argc, const char* argv[]) {
    try {
        vcsv::CliArgs args(argc, argv);

        if (args.getAction() == vcsv::CliArgs::Action::HELP) {
            showHelp();
            return 0;
        }

        const std::string& path = args.getFilePath();
        vcsv::Layout layout = args.getLayout() ? *args.getLayout() : vcsv::guess_layout_of_file(path);
        vcsv::Schema schema = vcsv::Schema::fromVersion(args.getSchemaVersion());
        vcsv::RecordReader reader = vcsv::parse_file(path, layout, schema, {}, args.getMmapThreshold());

        if (args.verbose()) {
            std::cerr << "vcsv: " << path << ": " << vcsv::layout_name(layout) << " layout, schema v"
                      << schema.version() << ", " << reader.sourceKind() << " source\n";
        }

        switch (args.getAction()) {
            case vcsv::CliArgs::Action::PRINT: {
                for (auto const& record : reader) {
                    if (args.outputAsJson())
                        std::cout << vcsv::to_json(record) << "\n";
                    else
                        std::cout << vcsv::to_text(record);
                }
                break;
            }

            case vcsv::CliArgs::Action::COUNT: {
                std::cout << reader.readAll().size() << "\n";
                break;
            }

            case vcsv::CliArgs::Action::FIELDS:
            case vcsv::CliArgs::Action::UNDECLARED: {
                // Labels are known once the first record has been assembled.
                reader.next();
                for (auto const& label : reader.fieldNames()) {
                    if (args.getAction() == vcsv::CliArgs::Action::UNDECLARED && schema.declares(label)) continue;
                    std::cout << label << "\n";
                }
                break;
            }

            case vcsv::CliArgs::Action::HELP:
                // Already handled above
                break;
        }

        if (args.verbose()) {
            std::cerr << "vcsv: " << reader.linesRead() << " lines, " << reader.recordsDecoded()
                      << " records decoded, " << reader.recordsAccepted() << " accepted\n";
        }
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
