#pragma once

#include <QStringList>
#include <algorithm>
#include <functional>
#include <vector>

// Named actions of the main window. Keybindings and menu entries refer to
// these by name.
struct Command
{
    QString name;
    QString description;
    std::function<void(const QStringList &args)> action;
};

class CommandManager
{
public:
    inline void
    reg(const QString &name, const QString &description,
        std::function<void(const QStringList &args)> action) noexcept
    {
        m_commands.push_back({name, description, std::move(action)});
    }

    inline const std::vector<Command> &commands() const noexcept
    {
        return m_commands;
    }

    const Command *find(const QString &name) const noexcept
    {
        auto it = std::find_if(m_commands.cbegin(), m_commands.cend(),
                               [&name](const Command &cmd)
        { return cmd.name == name; });
        return it == m_commands.cend() ? nullptr : &(*it);
    }

    // Returns false for unknown commands
    bool run(const QString &name, const QStringList &args = {}) const noexcept
    {
        const Command *cmd = find(name);
        if (!cmd || !cmd->action)
            return false;
        cmd->action(args);
        return true;
    }

private:
    std::vector<Command> m_commands;
};
