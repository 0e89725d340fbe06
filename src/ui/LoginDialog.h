// src/ui/LoginDialog.h
//
// LoginDialog – modal email/password prompt.  The dialog only collects
// credentials; MainWindow runs the login and reports back through
// setBusy() / showError() / accept().

#pragma once

#include <QDialog>

class QLabel;
class QLineEdit;
class QPushButton;

class LoginDialog : public QDialog
{
    Q_OBJECT

public:
    explicit LoginDialog(const QString& lastIdentity, QWidget* parent = nullptr);

    void setBusy(bool busy);
    void showError(const QString& message);

signals:
    void loginSubmitted(const QString& email, const QString& password);

private:
    void submit();

    QLineEdit*   m_emailEdit    = nullptr;
    QLineEdit*   m_passwordEdit = nullptr;
    QLabel*      m_errorLabel   = nullptr;
    QPushButton* m_loginBtn     = nullptr;
    QPushButton* m_cancelBtn    = nullptr;
};
