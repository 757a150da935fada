#pragma once

#include <QHBoxLayout>
#include <QLabel>
#include <QQueue>
#include <QString>
#include <QTimer>
#include <QWidget>

// Non-blocking notices, shown one after another for their duration.
class MessageBar : public QWidget
{
    Q_OBJECT

public:
    explicit MessageBar(QWidget *parent = nullptr);

    void showMessage(const QString &msg, float sec = 1.0f) noexcept;
    void clear() noexcept;

    inline bool isShowing() const noexcept
    {
        return m_showing;
    }

    inline QString currentMessage() const noexcept
    {
        return m_label->text();
    }

private:
    struct Message
    {
        QString message;
        float duration;
    };

    void showNext() noexcept;

    QLabel *m_label{new QLabel(this)};
    QTimer m_timer;
    QQueue<Message> m_queue;
    bool m_showing{false};
};
