#include "MessageBar.hpp"

MessageBar::MessageBar(QWidget *parent) : QWidget(parent)
{
    QHBoxLayout *layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 0, 8, 0);
    layout->addWidget(m_label);
    setLayout(layout);
    setFixedHeight(0);

    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, [this]()
    {
        setFixedHeight(0);
        m_label->clear();
        showNext();
    });
}

void
MessageBar::showMessage(const QString &msg, float sec) noexcept
{
    // Same notice back to back (e.g. repeated taps on an empty page)
    if (m_showing && m_label->text() == msg && m_queue.isEmpty())
    {
        m_timer.start(static_cast<int>(sec * 1000));
        return;
    }

    m_queue.enqueue({.message = msg, .duration = sec});
    if (!m_showing)
        showNext();
}

void
MessageBar::clear() noexcept
{
    m_queue.clear();
    m_timer.stop();
    m_label->clear();
    setFixedHeight(0);
    m_showing = false;
}

void
MessageBar::showNext() noexcept
{
    if (m_queue.isEmpty())
    {
        m_showing = false;
        return;
    }

    m_showing             = true;
    const auto [msg, sec] = m_queue.dequeue();

    m_label->setText(msg);
    setFixedHeight(30);
    m_timer.start(static_cast<int>(sec * 1000));
}
