#pragma once
#include <QObject>
#include <QTimer>

#include <functional>

/**
 * Repeating tick source used by PlaybackController.
 *
 * The controller only needs to arm/disarm a fixed-period callback, so the
 * timer is kept behind this small interface. The application uses
 * QtPlaybackTimer; tests drive the controller with a manual implementation
 * that advances virtual time.
 */
class PlaybackTimer
{
public:
    virtual ~PlaybackTimer() = default;

    virtual void start(int intervalMs) = 0;
    virtual void stop() = 0;
    virtual bool isActive() const = 0;
    virtual int interval() const = 0;

    void setTimeoutHandler(std::function<void()> handler) { m_handler = std::move(handler); }

protected:
    void fire()
    {
        if (m_handler) m_handler();
    }

private:
    std::function<void()> m_handler;
};

// QTimer-backed tick source, runs on the owning thread's event loop.
class QtPlaybackTimer : public QObject, public PlaybackTimer
{
    Q_OBJECT

public:
    explicit QtPlaybackTimer(QObject *parent = nullptr);

    void start(int intervalMs) override;
    void stop() override;
    bool isActive() const override;
    int interval() const override;

private:
    QTimer m_timer;
};
