#include <curses.h>
#include <algorithm>
#include <string>
#include <vector>

#include "ui/TransfersScreen.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

TransfersScreen::TransfersScreen(PackageService &service, UI &ui)
    : Screen(service, ui),
      _commandTable{
          {{"exit", "quit", "q"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _service.cancelAll();
               _ui.stop();
           }},
          {{"install", "i"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseInstallCommand(command);
           }},
          {{"cancel", "c"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseCancelCommand(command);
           }},
          {{"probe"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseProbeCommand(command);
           }},
          {{"catalog"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseCatalogCommand(command);
           }},
          {{"search"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseSearchCommand(command);
           }},
          {{"clear"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               size_t cleared = _ui.clearFinishedTransfers();
               _ui.setStatus("Cleared " + std::to_string(cleared) + " finished transfer(s)");
           }},
          {{"packages", "p"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::PACKAGES);
           }}}
{
}

void TransfersScreen::drawAvailableCommands(int &currentRow, WINDOW *win)
{
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "install <URL>  | Download and install a package");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "cancel [index] | Cancel a transfer, or all of them");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "probe <URL>    | Check that a package URL is reachable");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "catalog <URL>  | List the packages a repository offers");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "search <URL> <text> [type] | Search a repository");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "clear          | Forget finished transfers");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "packages       | Show installed packages (%zu)",
              _service.installedPackages().size());
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "exit           | Quit the program");
}

void TransfersScreen::drawScreen(int &currentRow, WINDOW *win)
{
    const auto &transfers = _ui.getTransfers();
    size_t running = _service.activeTransferUrls().size();

    if (transfers.empty())
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Transfers: None (%zu running, limit %zu)",
                  running, _service.getConfig().maxConcurrent);
        return;
    }

    mvwprintw(win, currentRow, LEFT_PADDING, "Transfers: %zu (%zu running, limit %zu)",
              transfers.size(), running, _service.getConfig().maxConcurrent);
    for (size_t i = 0; i < transfers.size(); ++i)
    {
        drawTransferProgress(++currentRow, win, i + 1, transfers[i]);
    }
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

void TransfersScreen::parseInstallCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: install <URL>");
        return;
    }

    auto handle = _service.install(args[0]);
    if (!handle)
    {
        _ui.setStatus(std::string("Cannot install: ") + handle.error().message);
        return;
    }

    _ui.track(handle.value());
    _ui.setStatus(handle->isJoinedExisting() ? "Already downloading " + args[0]
                                             : "Installing " + args[0]);
}

void TransfersScreen::parseCancelCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _service.cancelAll();
        _ui.setStatus("Cancelling all transfers");
        return;
    }

    auto index = parseIndexArgument(args[0]);
    const auto &transfers = _ui.getTransfers();
    if (!index || *index >= transfers.size())
    {
        _ui.setStatus("No transfer numbered " + args[0]);
        return;
    }

    if (_service.cancel(transfers[*index].handle.getUrl()))
        _ui.setStatus("Cancelling " + transfers[*index].handle.getUrl());
    else
        _ui.setStatus("Transfer " + args[0] + " is not running");
}

void TransfersScreen::parseProbeCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: probe <URL>");
        return;
    }

    auto result = _service.probe(args[0]);
    if (!result)
    {
        _ui.setStatus(std::string("Probe failed: ") + result.error().message);
        return;
    }

    std::string size = result->contentLength ? formatBytes(static_cast<double>(*result->contentLength)) : "size unknown";
    _ui.setStatus(std::string(result->available ? "Available" : "Unavailable") +
                  " (HTTP " + std::to_string(result->statusCode) + ", " + size + ")");
}

void TransfersScreen::parseCatalogCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: catalog <URL>");
        return;
    }

    auto catalog = _service.fetchCatalog(args[0]);
    if (!catalog)
    {
        _ui.setStatus(std::string("Catalog unavailable: ") + catalog.error().message);
        return;
    }

    std::string names;
    for (const auto &manifest : catalog.value())
    {
        names += (names.empty() ? "" : ", ") + manifest.name + " " + manifest.version;
    }
    _ui.setStatus(std::to_string(catalog->size()) + " package(s): " + names);
}

void TransfersScreen::parseSearchCommand(const std::string &command)
{
    auto args = extractArguments(command, 3);
    if (args.size() < 2)
    {
        _ui.setStatus("Usage: search <URL> <text> [type]");
        return;
    }

    CatalogQuery query;
    query.text = args[1];
    if (args.size() > 2)
        query.type = args[2];

    auto results = _service.searchCatalog(args[0], query);
    if (!results)
    {
        _ui.setStatus(std::string("Search failed: ") + results.error().message);
        return;
    }

    std::string names;
    for (const auto &manifest : results.value())
    {
        names += (names.empty() ? "" : ", ") + manifest.name + " (" + manifest.id + ")";
    }
    _ui.setStatus(std::to_string(results->size()) + " match(es): " + names);
}

void TransfersScreen::drawTransferProgress(int &currentRow, WINDOW *win, size_t index, const TrackedTransfer &tracked)
{
    const ProgressSnapshot &snapshot = tracked.latest;

    // <index>) [<status>] <url>
    mvwprintw(win, currentRow++, LEFT_PADDING + 1,
              "%zu) [%s] %s",
              index,
              statusName(snapshot.status),
              tracked.handle.getUrl().c_str());

    if (snapshot.status == TransferStatus::FAILED)
    {
        mvwprintw(win, currentRow++, LEFT_PADDING + 3, "%s error: %s",
                  errorKindName(snapshot.errorKind),
                  snapshot.errorMessage.value_or("unknown").c_str());
        return;
    }

    int filled = static_cast<int>(snapshot.fractionComplete * BAR_WIDTH);
    filled = std::min(filled, BAR_WIDTH);
    bool isMoving = snapshot.status == TransferStatus::DOWNLOADING;

    // [=======>   ] <progress>% (<received> / <total>) ETA: <time remaining> @ <speed>/s
    mvwaddstr(win, currentRow, 0, std::string(LEFT_PADDING, ' ').c_str());
    waddch(win, '[');
    for (int j = 0; j < BAR_WIDTH; ++j)
    {
        if (j < filled)
            waddch(win, '=');
        else if (j == filled)
            waddch(win, isMoving ? '>' : '|');
        else
            waddch(win, ' ');
    }
    waddch(win, ']');

    wprintw(win, " %.1f%%", snapshot.fractionComplete * 100.0);

    std::string received = formatBytes(static_cast<double>(snapshot.bytesReceived));
    if (snapshot.bytesTotal == 0)
        wprintw(win, " (%s, size unknown)", received.c_str());
    else
        wprintw(win, " (%s / %s)", received.c_str(), formatBytes(static_cast<double>(snapshot.bytesTotal)).c_str());

    if (isMoving)
    {
        wprintw(win, " ETA: %s @ %s/s",
                formatDuration(snapshot.estimatedSecondsRemaining).c_str(),
                formatBytes(snapshot.throughputBytesPerSec).c_str());
    }
    else if (!snapshot.message.empty())
    {
        wprintw(win, " %s", snapshot.message.c_str());
    }

    currentRow++;
}
