#ifndef DIALOGBASE_H
#define DIALOGBASE_H

#include <QDialog>
#include <QString>

/**
 * @brief Base class for KSpaceLab dialogs
 *
 * Consolidates:
 * - Window title and initial size
 * - Placement relative to the parent window
 * - Geometry persistence in QSettings("KSpaceLab", "KSpaceLab")
 *
 * Usage:
 * @code
 * class MyDialog : public DialogBase {
 * public:
 *     MyDialog(QWidget* parent = nullptr)
 *         : DialogBase(parent, "My Dialog Title", 400, 300) {}
 * };
 * @endcode
 */
class DialogBase : public QDialog {
    Q_OBJECT

public:
    /**
     * @param parent Parent widget
     * @param title Window title
     * @param defaultWidth Default window width (use 0 for auto)
     * @param defaultHeight Default window height (use 0 for auto)
     * @param deleteOnClose Delete dialog when closed
     */
    explicit DialogBase(QWidget* parent = nullptr,
                       const QString& title = QString(),
                       int defaultWidth = 0,
                       int defaultHeight = 0,
                       bool deleteOnClose = false);

    virtual ~DialogBase() = default;

    void setWindowProperties(const QString& title, int width = 0, int height = 0);

protected:
    void done(int result) override;

    /**
     * @brief Restore previous window geometry from settings
     * @param settingsKey Key to use in QSettings (default: class name)
     */
    void restoreWindowGeometry(const QString& settingsKey = QString());

    /**
     * @brief Save window geometry to settings for next session
     * @param settingsKey Key to use in QSettings (default: class name)
     */
    void saveWindowGeometry(const QString& settingsKey = QString());

private:
    QString geometryKey(const QString& settingsKey) const;
};

#endif // DIALOGBASE_H
