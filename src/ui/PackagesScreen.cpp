#include <curses.h>
#include <string>
#include <vector>

#include "ui/PackagesScreen.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

PackagesScreen::PackagesScreen(PackageService &service, UI &ui)
    : Screen(service, ui),
      _commandTable{
          {{"remove", "rm"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseRemoveCommand(command);
           }},
          {{"validate", "v"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseValidateCommand(command);
           }},
          {{"cleanup"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               auto removed = _service.cleanupCorrupted();
               _ui.setStatus("Removed " + std::to_string(removed.size()) + " corrupted package(s)");
           }},
          {{"file", "f"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseInstallFileCommand(command);
           }},
          {{"purge"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parsePurgeCommand(command);
           }},
          {{"refresh"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               size_t found = _service.refresh();
               _ui.setStatus("Found " + std::to_string(found) + " package(s)");
           }},
          {{"back", "b", ""},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::TRANSFERS);
           }}}
{
}

void PackagesScreen::drawAvailableCommands(int &currentRow, WINDOW *win)
{
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "remove <index|id>    | Delete an installed package");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "validate [index|id]  | Check package files are intact");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "cleanup              | Delete every package that fails validation");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "file <path>          | Install from a local ZIP archive");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "purge [all]          | Empty the download cache (%s)",
              formatBytes(static_cast<double>(_service.downloadCacheSize())).c_str());
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "refresh              | Rescan the install root");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "back                 | Return to transfers (%zu running)",
              _service.activeTransferUrls().size());
}

void PackagesScreen::drawScreen(int &currentRow, WINDOW *win)
{
    auto packages = _service.installedPackages();

    if (packages.empty())
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Installed packages: None (%s)",
                  _service.getConfig().installRoot.c_str());
        return;
    }

    mvwprintw(win, currentRow, LEFT_PADDING, "Installed packages: %zu, %s on disk",
              packages.size(), formatBytes(static_cast<double>(_service.totalInstalledSize())).c_str());

    for (size_t i = 0; i < packages.size(); ++i)
    {
        const auto &package = packages[i];
        const auto &manifest = package.manifest;

        // <index>) <name> <version> [<id>] - <type>
        mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "%zu) %s %s [%s] - %s",
                  i + 1,
                  manifest.name.c_str(),
                  manifest.version.c_str(),
                  manifest.id.c_str(),
                  manifest.type.c_str());

        if (manifest.author || manifest.description)
        {
            mvwprintw(win, ++currentRow, LEFT_PADDING + 3, "%s%s%s",
                      manifest.author.value_or("").c_str(),
                      (manifest.author && manifest.description) ? ": " : "",
                      manifest.description.value_or("").c_str());
        }

        // Installed at <time> in <directory>
        mvwprintw(win, ++currentRow, LEFT_PADDING + 3, "Installed %s in %s",
                  formatTime(package.installedAt).c_str(),
                  package.installRootPath.c_str());
    }

    auto errors = _service.getRegistry().lastScanErrors();
    if (!errors.empty())
    {
        mvwprintw(win, currentRow += 2, LEFT_PADDING, "Skipped directories: %zu", errors.size());
        for (const auto &error : errors)
        {
            mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "%s", error.message.c_str());
        }
    }
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

std::optional<InstalledPackage> PackagesScreen::resolvePackage(const std::string &argument) const
{
    auto index = parseIndexArgument(argument);
    if (index)
    {
        auto packages = _service.installedPackages();
        if (*index < packages.size())
            return packages[*index];
    }
    return _service.findById(argument);
}

void PackagesScreen::parseRemoveCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: remove <index|id>");
        return;
    }

    auto package = resolvePackage(args[0]);
    if (!package)
    {
        _ui.setStatus("No installed package " + args[0]);
        return;
    }

    Status status = _service.removePackage(package->manifest.id);
    _ui.setStatus(status ? "Removed " + package->manifest.name
                         : "Cannot remove " + package->manifest.name + ": " + status.error().message);
}

void PackagesScreen::parseValidateCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (!args.empty())
    {
        auto package = resolvePackage(args[0]);
        if (!package)
        {
            _ui.setStatus("No installed package " + args[0]);
            return;
        }
        bool intact = _service.validatePackage(package->manifest.id);
        _ui.setStatus(package->manifest.name + (intact ? " is intact" : " is damaged"));
        return;
    }

    // No argument, check everything
    std::string damaged;
    for (const auto &package : _service.installedPackages())
    {
        if (!_service.validatePackage(package.manifest.id))
            damaged += (damaged.empty() ? "" : ", ") + package.manifest.id;
    }
    _ui.setStatus(damaged.empty() ? "All packages are intact" : "Damaged: " + damaged);
}

void PackagesScreen::parseInstallFileCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: file <path>");
        return;
    }

    auto package = _service.installFromFile(args[0]);
    if (!package)
    {
        _ui.setStatus("Cannot install " + args[0] + ": " + package.error().message);
        return;
    }
    _ui.setStatus("Installed " + package->manifest.name + " " + package->manifest.version);
}

void PackagesScreen::parsePurgeCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    bool onlyArchives = args.empty() || args[0] != "all";

    size_t removed = _service.cleanupDownloads(onlyArchives);
    _ui.setStatus("Deleted " + std::to_string(removed) + " file(s) from the download cache");
}
