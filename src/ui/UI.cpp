#include <curses.h>
#include <chrono>
#include <thread>
#include <algorithm>
#include <cctype>

#include "ui/UI.hpp"
#include "ui/TransfersScreen.hpp"
#include "ui/PackagesScreen.hpp"
#include "util/format.hpp"

// Constructs the UI object, starting on the transfers screen
UI::UI(PackageService &service)
    : _service(service),
      _isRunning(true),
      _lastFullUpdateTime(std::chrono::steady_clock::now()),
      _screen(std::make_unique<TransfersScreen>(_service, *this))
{
}

// Runs the main UI loop, initialising and cleaning up curses and drawing the full screen
void UI::run()
{
    initialiseCurses();
    createWindows();
    drawFullScreen();

    while (_isRunning)
    {
        processInput();
        updateScreen();
        sleepBriefly(10); // 10ms sleep between render
    }

    destroyWindows();
    cleanupCurses();
}

void UI::stop()
{
    _isRunning = false;
}

// Changes the current screen to the specified type
void UI::changeScreen(ScreenType newScreen)
{
    switch (newScreen)
    {
    case ScreenType::TRANSFERS:
        _screen = std::make_unique<TransfersScreen>(_service, *this);
        break;
    case ScreenType::PACKAGES:
        _screen = std::make_unique<PackagesScreen>(_service, *this);
        break;
    }

    _scrollOffset = 0;
    drawFullScreen();
}

// Adds a transfer to the list, unless this session already follows it
void UI::track(const TransferHandle &handle)
{
    auto existing = std::find_if(_transfers.begin(), _transfers.end(), [&handle](const TrackedTransfer &tracked)
                                 { return tracked.handle.getTaskId() == handle.getTaskId() &&
                                          !isTerminalStatus(tracked.latest.status); });
    if (existing != _transfers.end())
        return;

    _transfers.push_back(TrackedTransfer{handle, ProgressSnapshot{}});
}

// Drops completed, failed and cancelled transfers from the list
size_t UI::clearFinishedTransfers()
{
    size_t before = _transfers.size();
    _transfers.erase(std::remove_if(_transfers.begin(), _transfers.end(), [](const TrackedTransfer &tracked)
                                    { return isTerminalStatus(tracked.latest.status); }),
                     _transfers.end());
    return before - _transfers.size();
}

void UI::setStatus(const std::string &message)
{
    _status = message;
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

// Initialises curses and sets up the terminal
void UI::initialiseCurses()
{
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // Non-blocking getch
}

void UI::cleanupCurses()
{
    endwin();
}

// Creates the windows for the header, command line, and body
void UI::createWindows()
{
    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX);

    _headerHeight = 1;                                                    // Determined according to content
    _cmdLineHeight = 3;                                                   // Status line, prompt, padding
    _headerWin = newwin(_headerHeight, maxX, 0, 0);
    _cmdLineWin = newwin(_cmdLineHeight, maxX, maxY - _cmdLineHeight, 0);

    _padWidth = maxX;
    _padHeight = 1000;
    _bodyPad = newpad(_padHeight, _padWidth);

    scrollok(_headerWin, FALSE);
    scrollok(_cmdLineWin, FALSE);
    scrollok(_bodyPad, FALSE);
}

// Destroys the windows created by createWindows
void UI::destroyWindows()
{
    if (_headerWin)
    {
        delwin(_headerWin);
        _headerWin = nullptr;
    }

    if (_cmdLineWin)
    {
        delwin(_cmdLineWin);
        _cmdLineWin = nullptr;
    }

    if (_bodyPad)
    {
        delwin(_bodyPad);
        _bodyPad = nullptr;
    }
}

// Checks for keyboard input and processes each keypress if available
void UI::processInput()
{
    int ch = getch();
    while (ch != ERR)
    {
        handleKeyPress(ch);
        ch = getch();
    }
}

// Interprets a single keypress to update or complete the command buffer
void UI::handleKeyPress(int ch)
{
    switch (ch)
    {
    case '\n':
    case '\r':
        handleCommand(_commandBuffer);
        _commandBuffer.clear();
        break;

    case KEY_BACKSPACE:
    case 127: // DEL
        if (!_commandBuffer.empty())
            _commandBuffer.pop_back();
        break;

    case KEY_UP:
        scrollUp();
        break;
    case KEY_DOWN:
        scrollDown();
        break;
    case KEY_PPAGE:
        scrollUp(5);
        break;
    case KEY_NPAGE:
        scrollDown(5);
        break;

    default:
        if (std::isprint(ch))
            _commandBuffer.push_back(static_cast<char>(ch));
        break;
    }

    updateScreen(true);
}

// Runs the first entry of the dispatch table whose alias matches the input
void UI::handleCommand(const std::string &userInput)
{
    // The action may replace _screen, so hold on to it for the duration
    const std::vector<CommandEntry> table = _screen->getCommandTable();

    for (const auto &entry : table)
    {
        for (const auto &alias : entry.commands)
        {
            bool match = false;
            switch (entry.matchType)
            {
            case MatchType::EXACT:
                match = (userInput == alias);
                break;
            case MatchType::PREFIX:
                match = userInput.rfind(alias, 0) == 0 &&
                        (userInput.size() == alias.size() || userInput[alias.size()] == ' ');
                break;
            }
            if (match)
            {
                entry.action(userInput);
                updateScreen(true);
                return;
            }
        }
    }

    if (!userInput.empty())
        setStatus("Unknown command: " + userInput);
    updateScreen(true);
}

// Drains whatever snapshots each tracked transfer has published since the last poll
void UI::pollTransfers()
{
    for (auto &tracked : _transfers)
    {
        ProgressSnapshot snapshot;
        while (tracked.handle.next(snapshot, std::chrono::milliseconds(0)))
        {
            tracked.latest = snapshot;
        }
    }
}

// Periodically updates the screen (full or partial) based on elapsed time
void UI::updateScreen(bool immediate)
{
    auto now = std::chrono::steady_clock::now();
    double secondsSinceLastFullUpdate = std::chrono::duration<double>(now - _lastFullUpdateTime).count();

    // Redraw the entire interface every half second or immediately, if specified
    if (immediate || secondsSinceLastFullUpdate >= 0.5)
    {
        pollTransfers();
        drawFullScreen();
        _lastFullUpdateTime = now;
    }
    else
    {
        drawCommandLine();
    }
}

// Redraws the entire curses interface
void UI::drawFullScreen()
{
    clearScreen();

    drawHeader(); // Updates the header height

    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX);

    mvwin(_headerWin, 0, 0);
    wresize(_headerWin, _headerHeight, maxX);
    wrefresh(_headerWin);

    _maxContentHeight = maxY - _headerHeight - _cmdLineHeight - 1;

    mvwin(_cmdLineWin, maxY - _cmdLineHeight, 0);
    wresize(_cmdLineWin, _cmdLineHeight, maxX);
    wrefresh(_cmdLineWin);

    drawBody();
    drawCommandLine();

    prefresh(
        _bodyPad,
        _scrollOffset,                     // Pad row to start reading
        0,                                 // Pad col to start reading
        _headerHeight,                     // Top alignment of the pad (below the header)
        0,                                 // Left alignment of the pad
        _headerHeight + _maxContentHeight, // Bottom alignment of the pad (above the command line)
        _padWidth - 1);                    // Right alignment of the pad
}

// Draws the header content and available commands
void UI::drawHeader()
{
    werase(_headerWin);

    int currentRow = 0;
    mvwprintw(_headerWin, ++currentRow, LEFT_PADDING, "SSM - Simple Skin Manager");
    mvwprintw(_headerWin, currentRow += 2, LEFT_PADDING, "Commands:");
    _screen->drawAvailableCommands(currentRow, _headerWin);

    wrefresh(_headerWin);

    _headerHeight = currentRow + 2;
}

void UI::drawBody()
{
    int currentRow = 0;
    _screen->drawScreen(currentRow, _bodyPad);
    _padHeight = std::max(currentRow + 1, _maxContentHeight);
}

// Draws the status line and the prompt at the bottom of the screen
void UI::drawCommandLine()
{
    werase(_cmdLineWin);

    if (!_status.empty())
        mvwprintw(_cmdLineWin, 0, LEFT_PADDING, "%s", truncateMiddle(_status, _padWidth - 2 * LEFT_PADDING).c_str());

    mvwprintw(_cmdLineWin, 1, LEFT_PADDING, "> %s", _commandBuffer.c_str());
    wmove(_cmdLineWin, 1, LEFT_PADDING + 2 + (int)_commandBuffer.size());

    wrefresh(_cmdLineWin);
}

void UI::clearScreen()
{
    werase(_headerWin);
    werase(_cmdLineWin);
    werase(_bodyPad);
}

// Scrolls the screen body up by n lines
void UI::scrollUp(int lines)
{
    _scrollOffset = std::max(_scrollOffset - lines, 0);
}

// Scrolls the screen body down by n lines
void UI::scrollDown(int lines)
{
    int maxOffset = std::max(_padHeight - _maxContentHeight, 0);
    _scrollOffset = std::min(_scrollOffset + lines, maxOffset);
}

// Pauses execution briefly to prevent excessive CPU usage in the UI loop
void UI::sleepBriefly(int intervalMs)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(intervalMs));
}
