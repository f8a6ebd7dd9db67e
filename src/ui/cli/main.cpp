#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        chunkvault::ui::cli::lockProcessMemory();

        std::vector<std::string> args{};
        for (int i{ 1 }; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }

        chunkvault::ui::cli::CommandLine cli{ std::cout, std::cerr, chunkvault::ui::cli::readPassphrase };
        return cli.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
