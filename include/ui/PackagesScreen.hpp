#ifndef PACKAGES_SCREEN_HPP
#define PACKAGES_SCREEN_HPP

#include <optional>

#include "ui/Screen.hpp"
#include "ui/UI.hpp"

class PackagesScreen : public Screen
{
public:
    explicit PackagesScreen(PackageService &service, UI &ui);

    const std::vector<CommandEntry> &getCommandTable() const override { return _commandTable; }
    void drawAvailableCommands(int &currentRow, WINDOW *window) override;
    void drawScreen(int &currentRow, WINDOW *window) override;

private:
    const std::vector<CommandEntry> _commandTable;

    // Accepts a list index or a package id
    std::optional<InstalledPackage> resolvePackage(const std::string &argument) const;

    void parseRemoveCommand(const std::string &command);
    void parseValidateCommand(const std::string &command);
    void parseInstallFileCommand(const std::string &command);
    void parsePurgeCommand(const std::string &command);
};

#endif
