#ifndef SCREEN_HPP
#define SCREEN_HPP

#include <curses.h>
#include <string>
#include <vector>
#include <functional>

#include "core/PackageService.hpp"

class UI;

enum class MatchType
{
    EXACT,
    PREFIX // Alias followed by arguments
};

struct CommandEntry
{
    std::vector<std::string> commands;
    MatchType matchType;
    std::function<void(const std::string &)> action;
};

enum class ScreenType
{
    TRANSFERS,
    PACKAGES
};

class Screen
{
public:
    explicit Screen(PackageService &service, UI &ui) : _service(service), _ui(ui) {}
    virtual ~Screen() = default;

    virtual const std::vector<CommandEntry> &getCommandTable() const = 0;
    virtual void drawAvailableCommands(int &currentRow, WINDOW *window) = 0;
    virtual void drawScreen(int &currentRow, WINDOW *window) = 0;

protected:
    PackageService &_service;
    UI &_ui;
};

#endif
