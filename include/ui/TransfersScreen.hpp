#ifndef TRANSFERS_SCREEN_HPP
#define TRANSFERS_SCREEN_HPP

#include "ui/Screen.hpp"
#include "ui/UI.hpp"

class TransfersScreen : public Screen
{
public:
    explicit TransfersScreen(PackageService &service, UI &ui);

    const std::vector<CommandEntry> &getCommandTable() const override { return _commandTable; }
    void drawAvailableCommands(int &currentRow, WINDOW *window) override;
    void drawScreen(int &currentRow, WINDOW *window) override;

private:
    const std::vector<CommandEntry> _commandTable;

    void parseInstallCommand(const std::string &command);
    void parseCancelCommand(const std::string &command);
    void parseProbeCommand(const std::string &command);
    void parseCatalogCommand(const std::string &command);
    void parseSearchCommand(const std::string &command);
    void drawTransferProgress(int &currentRow, WINDOW *win, size_t index, const TrackedTransfer &tracked);
};

#endif
