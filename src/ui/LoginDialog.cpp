// src/ui/LoginDialog.cpp

#include "LoginDialog.h"

#include "core/Validation.h"

#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

LoginDialog::LoginDialog(const QString& lastIdentity, QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Login"));
    setModal(true);
    setMinimumWidth(360);

    auto* mainLayout = new QVBoxLayout(this);

    auto* form = new QFormLayout();
    m_emailEdit = new QLineEdit(this);
    m_emailEdit->setPlaceholderText(tr("name@company.com"));
    m_emailEdit->setText(lastIdentity);
    form->addRow(tr("Email:"), m_emailEdit);

    m_passwordEdit = new QLineEdit(this);
    m_passwordEdit->setEchoMode(QLineEdit::Password);
    form->addRow(tr("Password:"), m_passwordEdit);
    mainLayout->addLayout(form);

    m_errorLabel = new QLabel(this);
    m_errorLabel->setStyleSheet("QLabel { color: red; }");
    m_errorLabel->setWordWrap(true);
    m_errorLabel->hide();
    mainLayout->addWidget(m_errorLabel);

    auto* buttons = new QHBoxLayout();
    buttons->addStretch(1);
    m_cancelBtn = new QPushButton(tr("Cancel"), this);
    connect(m_cancelBtn, &QPushButton::clicked, this, &QDialog::reject);
    buttons->addWidget(m_cancelBtn);

    m_loginBtn = new QPushButton(tr("Login"), this);
    m_loginBtn->setDefault(true);
    connect(m_loginBtn, &QPushButton::clicked, this, &LoginDialog::submit);
    buttons->addWidget(m_loginBtn);
    mainLayout->addLayout(buttons);

    connect(m_passwordEdit, &QLineEdit::returnPressed, this, &LoginDialog::submit);

    if (lastIdentity.isEmpty()) {
        m_emailEdit->setFocus();
    } else {
        m_passwordEdit->setFocus();
    }
}

void LoginDialog::submit()
{
    const QString email = m_emailEdit->text().trimmed();
    if (!mdi::isValidEmail(email)) {
        showError(tr("Please enter a valid email address."));
        return;
    }
    if (m_passwordEdit->text().isEmpty()) {
        showError(tr("Please enter your password."));
        return;
    }
    m_errorLabel->hide();
    emit loginSubmitted(email, m_passwordEdit->text());
}

void LoginDialog::setBusy(bool busy)
{
    m_emailEdit->setEnabled(!busy);
    m_passwordEdit->setEnabled(!busy);
    m_loginBtn->setEnabled(!busy);
    m_loginBtn->setText(busy ? tr("Logging in...") : tr("Login"));
}

void LoginDialog::showError(const QString& message)
{
    m_errorLabel->setText(message);
    m_errorLabel->show();
    m_passwordEdit->clear();
    m_passwordEdit->setFocus();
}
